#include "log_template.hpp"
#include <core/sandbox_policy.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

std::string request_marker(int rally) {
    return fmt::format("{}{})", markers::REQUEST_PREFIX, rally);
}

std::string response_marker(int rally) {
    return fmt::format("{}{})", markers::RESPONSE_PREFIX, rally);
}

const char* default_log_template() {
    return R"(# Assistant Discussion Log

- **Date**: {{DATETIME}}
- **Topic**: {{TOPIC}}
- **Purpose**: {{PURPOSE}}
- **Session**: {{SESSION_ID}}
- **Working directory**: {{WORKDIR}} <!-- "none" runs without --cd -->
- **Sandbox**: {{SANDBOX}}
- **Reference paths**:
{{REFPATHS}}

---

## Requester → Assistant (1)

{{QUESTION}}

## Assistant → Requester (1)

{{ANSWER}}

## Conclusion

- **Summary**: {{SUMMARY}}
- **Next action**: {{NEXT_ACTION}}
)";
}

std::string render_template(const std::string& tmpl, const TemplateValues& values) {
    std::string refpaths;
    for (const auto& p : values.reference_paths) {
        std::string path = StringUtils::trim(p);
        if (path.empty()) continue;
        if (!refpaths.empty()) refpaths += '\n';
        refpaths += "  - " + path;
    }
    if (refpaths.empty()) refpaths = placeholders::NO_REFPATHS;

    std::string workdir = values.working_dir && !values.working_dir->empty()
        ? *values.working_dir : placeholders::NO_WORKDIR;

    std::string out = tmpl;
    out = StringUtils::replace_all(out, "{{DATETIME}}", values.datetime);
    out = StringUtils::replace_all(out, "{{TOPIC}}", values.topic);
    out = StringUtils::replace_all(out, "{{PURPOSE}}",
                                   values.purpose.empty() ? placeholders::PURPOSE : values.purpose);
    out = StringUtils::replace_all(out, "{{SESSION_ID}}", placeholders::SESSION_ID);
    out = StringUtils::replace_all(out, "{{WORKDIR}}", workdir);
    out = StringUtils::replace_all(out, "{{SANDBOX}}", isolation_name(values.isolation));
    out = StringUtils::replace_all(out, "{{REFPATHS}}", refpaths);
    out = StringUtils::replace_all(out, "{{QUESTION}}", placeholders::QUESTION);
    out = StringUtils::replace_all(out, "{{ANSWER}}", placeholders::ANSWER);
    out = StringUtils::replace_all(out, "{{SUMMARY}}", placeholders::SUMMARY);
    out = StringUtils::replace_all(out, "{{NEXT_ACTION}}", placeholders::NEXT_ACTION);
    return out;
}

Result<std::string> load_template(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<std::string>::Err(ErrorCode::TemplateMissing,
            fmt::format("Template file not found: {} (run `rally setup`)", path.string()));
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err(ErrorCode::IoError, "Cannot read template " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::Ok(ss.str());
}

Result<bool> install_default_template(const fs::path& path) {
    if (fs::exists(path)) return Result<bool>::Ok(false);

    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<bool>::Err(ErrorCode::IoError,
            fmt::format("Failed to create {}: {}", path.parent_path().string(), ec.message()));
    }

    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return Result<bool>::Err(ErrorCode::IoError, "Failed to write template " + path.string());
    }
    out << default_log_template();
    out.close();
    if (!out) {
        return Result<bool>::Err(ErrorCode::IoError, "Failed to write template " + path.string());
    }
    return Result<bool>::Ok(true);
}
