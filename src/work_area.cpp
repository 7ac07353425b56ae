#include "work_area.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <vector>
#include <stdlib.h>

namespace fs = std::filesystem;

WorkArea WorkArea::open(const fs::path& root) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw std::runtime_error("cannot create work root " + root.string() + ": " + ec.message());
    }

    std::string tmpl = (root / "codebox-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed under " + root.string() + ": " + std::strerror(errno));
    }

    fs::path dir = fs::canonical(fs::path(buf.data()), ec);
    if (ec) dir = fs::path(buf.data());
    std::cout << "[work-area] Created " << dir.string() << std::endl;
    return WorkArea(dir);
}

WorkArea::WorkArea(WorkArea&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

WorkArea::~WorkArea() {
    close();
}

void WorkArea::close() {
    if (path_.empty()) return;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        std::cerr << "[work-area] Error cleaning up " << path_.string() << ": " << ec.message() << std::endl;
    } else {
        std::cout << "[work-area] Cleaned up " << path_.string() << std::endl;
    }
    path_.clear();
}

bool is_strictly_inside(const fs::path& parent, const fs::path& child) {
    auto c = child.begin();
    for (auto p = parent.begin(); p != parent.end(); ++p) {
        // a trailing separator shows up as an empty element
        if (p->empty()) continue;
        if (c == child.end() || *p != *c) return false;
        ++c;
    }
    for (; c != child.end(); ++c) {
        if (!c->empty()) return true;
    }
    return false;
}

std::optional<fs::path> WorkArea::resolve_inside(const std::string& name) const {
    if (path_.empty() || name.empty()) return std::nullopt;
    if (name.find('\0') != std::string::npos) return std::nullopt;

    fs::path requested(name);
    if (requested.is_absolute() || requested.has_root_name()) return std::nullopt;

    std::error_code ec;
    fs::path dest = fs::weakly_canonical(path_ / requested, ec);
    if (ec) return std::nullopt;

    if (!is_strictly_inside(path_, dest)) return std::nullopt;
    return dest;
}
