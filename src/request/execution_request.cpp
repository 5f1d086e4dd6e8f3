/**
 * @file execution_request.cpp
 * @brief Structural request validation.
 */

#include "request/execution_request.hpp"

namespace execution_engine {

bool is_safe_relative_path(std::string_view path) noexcept {
    if (path.empty() || path.front() == '/') return false;

    size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        auto segment = path.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") return false;
        if (segment.find('\0') != std::string_view::npos) return false;
        start = end + 1;
    }
    return true;
}

Result<void> validate_request(const ExecutionRequest& request) {
    if (request.request_id.empty()) {
        return Error{ErrorCode::InvalidArgument, "request_id must not be empty"};
    }
    if (request.runtime.empty()) {
        return Error{ErrorCode::InvalidArgument, "runtime must not be empty"};
    }

    const auto& source = request.source;
    switch (source.kind) {
        case SourceKind::InlineCode:
            if (source.inline_code.empty()) {
                return Error{ErrorCode::InvalidArgument, "inline source is empty"};
            }
            break;
        case SourceKind::FileSet:
            if (source.files.empty()) {
                return Error{ErrorCode::InvalidArgument, "file set is empty"};
            }
            for (const auto& file : source.files) {
                if (!is_safe_relative_path(file.path)) {
                    return Error{ErrorCode::InvalidArgument, "unsafe source path: " + file.path};
                }
            }
            break;
        case SourceKind::RepositoryRef:
        case SourceKind::ArchiveRef:
            if (source.reference.empty()) {
                return Error{ErrorCode::InvalidArgument,
                             std::string{to_string(source.kind)} + " reference is empty"};
            }
            break;
    }

    if (!request.entry_point.empty() && !is_safe_relative_path(request.entry_point)) {
        return Error{ErrorCode::InvalidArgument, "unsafe entry point: " + request.entry_point};
    }
    for (const auto& output : request.outputs) {
        if (!is_safe_relative_path(output)) {
            return Error{ErrorCode::InvalidArgument, "unsafe output path: " + output};
        }
    }
    for (const auto& test : request.test_cases) {
        for (const auto& [path, _] : test.expected_files) {
            if (!is_safe_relative_path(path)) {
                return Error{ErrorCode::InvalidArgument,
                             "test '" + test.name + "' has unsafe file path: " + path};
            }
        }
    }
    return {};
}

}  // namespace execution_engine
