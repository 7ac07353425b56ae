#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "execution_types.hpp"
#include "http_fetcher.hpp"

class WorkArea;

struct StagedFile {
    std::string filename;
    std::string url;        // after resolution against the base origin
    bool staged = false;
    std::size_t bytes = 0;
    std::string warning;    // set when staged is false
};

struct StageReport {
    std::vector<StagedFile> files;

    // Bracketed diagnostic lines, one per failed file, each ending in '\n'.
    std::string warnings() const;
    std::size_t staged_count() const;
};

// "/path" and "//host/path" are taken relative to base_origin, anything else as is.
std::string resolve_source_url(const std::string& base_origin, const std::string& url);

// Populates a work area with the declared inputs. A failing input never
// stops the others and nothing is thrown to the caller.
class InputStager {
public:
    InputStager(IFetcher& fetcher, std::string base_origin, std::chrono::milliseconds fetch_timeout);

    StageReport stage(const WorkArea& area, const std::vector<InputFileSpec>& specs);

private:
    StagedFile stage_one(const WorkArea& area, const InputFileSpec& spec);

    IFetcher& fetcher_;
    std::string base_origin_;
    std::chrono::milliseconds fetch_timeout_;
};
