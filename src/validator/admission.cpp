#include <sqlgate/validator/admission.hpp>
#include <sqlgate/core/utils.hpp>

namespace sqlgate {

const std::vector<std::string>& AdmissionFilter::denied_keywords() {
    static const std::vector<std::string> keywords = {
        // data mutation
        "INSERT", "UPDATE", "DELETE",
        // schema mutation
        "DROP", "ALTER",
        // attachment and configuration
        "ATTACH", "DETACH", "PRAGMA",
        // maintenance; VACUUM INTO writes a file
        "VACUUM", "REINDEX"
    };
    return keywords;
}

std::string AdmissionFilter::strip_terminator(const std::string& trimmed) {
    if (!trimmed.empty() && trimmed[trimmed.size() - 1] == ';') {
        return rtrim(trimmed.substr(0, trimmed.size() - 1));
    }
    return trimmed;
}

Admission AdmissionFilter::admit(const std::string& query) {
    const std::string normalized = strip_terminator(trim(query));

    // A terminator left after the single strip means chaining or ";;"
    if (normalized.find(';') != std::string::npos) {
        return Admission::reject("statement terminator inside query");
    }

    const std::string upper = to_upper(normalized);
    const std::vector<std::string>& keywords = denied_keywords();
    for (size_t i = 0; i < keywords.size(); ++i) {
        if (upper.find(keywords[i]) != std::string::npos) {
            return Admission::reject("denied keyword " + keywords[i]);
        }
    }

    return Admission::allow(normalized);
}

} // namespace sqlgate
