#include "artifact_store.hpp"
#include "code_assembler.hpp"
#include "work_area.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace fs = std::filesystem;

std::string random_uuid() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);

    std::ostringstream ss;
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b[i]);
    }
    return ss.str();
}

std::string sha256_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw std::runtime_error("cannot read " + p.string());

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("sha256 init failed");
    }
    char buf[8192];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buf, static_cast<size_t>(in.gcount())) != 1) {
            throw std::runtime_error("sha256 update failed");
        }
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &len) != 1) {
        throw std::runtime_error("sha256 final failed");
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < len; ++i) ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    return ss.str();
}

std::string content_type_for(const fs::path& p) {
    static const std::unordered_map<std::string, std::string> types = {
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".pdf", "application/pdf"},
        {".txt", "text/plain"},
        {".json", "application/json"},
        {".py", "text/x-python"},
        {".csv", "text/csv"},
    };
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

ArtifactStore::ArtifactStore(fs::path root, std::string url_prefix)
    : root_(std::move(root)), url_prefix_(std::move(url_prefix)) {
    while (!url_prefix_.empty() && url_prefix_.back() == '/') url_prefix_.pop_back();
}

bool ArtifactStore::is_safe_component(const std::string& s) {
    if (s.empty() || s.size() > 255) return false;
    if (s.find("..") != std::string::npos) return false;
    if (s == ".") return false;
    return s.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

std::string ArtifactStore::new_artifact_name() {
    return "plot_" + random_uuid() + ".png";
}

// rename(), or copy + remove when the store lives on another filesystem.
static void move_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;
    if (ec != std::errc::cross_device_link) {
        throw fs::filesystem_error("move failed", from, to, ec);
    }
    fs::copy_file(from, to, fs::copy_options::none);
    fs::remove(from);
}

PromotionResult ArtifactStore::promote(const fs::path& work_dir, const std::string& session_id) const {
    PromotionResult out;

    fs::path produced = work_dir / kArtifactFilename;
    std::error_code ec;
    auto st = fs::symlink_status(produced, ec);
    if (ec || !fs::exists(st)) return out;
    if (!fs::is_regular_file(st)) {
        // a symlink or directory named like the artifact is never copied out
        std::cerr << "[artifacts] Ignoring non-regular " << produced.string() << std::endl;
        out.warning = "[Error processing generated plot: " + std::string(kArtifactFilename) + " is not a regular file]";
        return out;
    }

    try {
        if (!is_safe_component(session_id)) {
            throw std::runtime_error("invalid session id");
        }
        fs::path dir = root_ / session_id;
        // concurrent requests of one session may race here; existing is fine
        fs::create_directories(dir, ec);
        if (ec && !fs::is_directory(dir)) {
            throw fs::filesystem_error("cannot create session directory", dir, ec);
        }

        std::string name = new_artifact_name();
        fs::path dest = dir / name;
        move_file(produced, dest);

        out.stored_path = dest;
        out.reference = url_prefix_ + "/" + session_id + "/" + name;
        std::cout << "[artifacts] Moved plot to " << dest.string() << ", served as " << *out.reference << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[artifacts] Error moving/processing plot file " << produced.string() << ": " << e.what() << std::endl;
        out.reference.reset();
        out.stored_path.reset();
        out.warning = std::string("[Error processing generated plot: ") + e.what() + "]";
    }
    return out;
}

std::optional<fs::path> ArtifactStore::locate(const std::string& session_id, const std::string& filename) const {
    if (!is_safe_component(session_id) || !is_safe_component(filename)) return std::nullopt;

    std::error_code ec;
    fs::path root = fs::weakly_canonical(root_, ec);
    if (ec) return std::nullopt;
    fs::path file = fs::weakly_canonical(root / session_id / filename, ec);
    if (ec || !is_strictly_inside(root, file)) return std::nullopt;
    if (!fs::is_regular_file(file, ec)) return std::nullopt;
    return file;
}
