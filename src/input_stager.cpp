#include "input_stager.hpp"
#include "code_assembler.hpp"
#include "executors/script_executor.hpp"
#include "work_area.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

std::string StageReport::warnings() const {
    std::string out;
    for (const auto& f : files) {
        if (!f.staged && !f.warning.empty()) out += f.warning + "\n";
    }
    return out;
}

std::size_t StageReport::staged_count() const {
    std::size_t n = 0;
    for (const auto& f : files) n += f.staged ? 1 : 0;
    return n;
}

std::string resolve_source_url(const std::string& base_origin, const std::string& url) {
    if (url.empty() || url[0] != '/') return url;

    auto parsed = parse_url(base_origin);
    if (!parsed) return base_origin + url;
    if (url.rfind("//", 0) == 0) return parsed->scheme + ":" + url;
    return parsed->origin() + url;
}

InputStager::InputStager(IFetcher& fetcher, std::string base_origin, std::chrono::milliseconds fetch_timeout)
    : fetcher_(fetcher), base_origin_(std::move(base_origin)), fetch_timeout_(fetch_timeout) {}

StageReport InputStager::stage(const WorkArea& area, const std::vector<InputFileSpec>& specs) {
    StageReport report;
    for (const auto& spec : specs) {
        report.files.push_back(stage_one(area, spec));
    }
    if (!specs.empty()) {
        std::cout << "[stager] Staged " << report.staged_count() << "/" << specs.size()
                  << " input files into " << area.path().string() << std::endl;
    }
    return report;
}

StagedFile InputStager::stage_one(const WorkArea& area, const InputFileSpec& spec) {
    StagedFile out;
    out.filename = spec.filename;
    out.url = resolve_source_url(base_origin_, spec.source_url);

    auto target = area.resolve_inside(spec.filename);
    if (!target) {
        std::cerr << "[stager] Skipping input file due to invalid path: " << spec.filename << std::endl;
        out.warning = "[Warning: Skipped input file with potentially unsafe path: " + spec.filename + "]";
        return out;
    }
    // the script and the artifact slot belong to the service
    if (*target == area.path() / kScriptFilename || *target == area.path() / kArtifactFilename) {
        std::cerr << "[stager] Skipping input file with reserved name: " << spec.filename << std::endl;
        out.warning = "[Warning: Skipped input file with reserved name: " + spec.filename + "]";
        return out;
    }

    std::string body;
    try {
        std::cout << "[stager] Fetching input file '" << spec.filename << "' from " << out.url << std::endl;
        body = fetcher_.fetch(out.url, fetch_timeout_);
    } catch (const FetchError& e) {
        std::cerr << "[stager] Error fetching input file " << spec.filename << " from " << out.url
                  << ": " << e.what() << std::endl;
        out.warning = "[Error fetching input file '" + spec.filename + "': " + e.what() + "]";
        return out;
    } catch (const std::exception& e) {
        std::cerr << "[stager] Unexpected error fetching " << spec.filename << ": " << e.what() << std::endl;
        out.warning = "[Unexpected error handling input file '" + spec.filename + "']";
        return out;
    }

    std::error_code ec;
    fs::create_directories(target->parent_path(), ec);
    if (ec) {
        out.warning = "[Error writing input file '" + spec.filename + "': " + ec.message() + "]";
        std::cerr << "[stager] " << out.warning << std::endl;
        return out;
    }

    std::ofstream file(*target, std::ios::binary | std::ios::trunc);
    if (file) file.write(body.data(), static_cast<std::streamsize>(body.size()));
    file.close();
    if (!file) {
        out.warning = "[Error writing input file '" + spec.filename + "': cannot write " + target->string() + "]";
        std::cerr << "[stager] " << out.warning << std::endl;
        return out;
    }

    out.staged = true;
    out.bytes = body.size();
    std::cout << "[stager] Wrote input file " << target->string() << " (" << out.bytes << " bytes)" << std::endl;
    return out;
}
