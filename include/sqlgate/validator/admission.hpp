/*
 * sqlgate - Admission Filter
 *
 * Lexical gate applied to every submitted query before a sandbox exists:
 *
 *   1. trim surrounding whitespace
 *   2. strip exactly one trailing ';'
 *   3. reject if any ';' remains (no statement chaining)
 *   4. reject if the text contains a denied keyword, case-insensitive,
 *      anywhere (identifiers and string literals included)
 *
 * This is a coarse keyword screen, not a parser. It over-blocks
 * ("SELECT updated_at" is rejected) and it is not a guarantee of semantic
 * safety on its own; the sandbox engine settings are the second line.
 */
#ifndef sqlgate_VALIDATOR_ADMISSION_HPP
#define sqlgate_VALIDATOR_ADMISSION_HPP

#include <string>
#include <vector>

namespace sqlgate {

struct Admission {
    bool allowed;
    std::string query;      // normalized query, set when allowed
    std::string reason;     // internal detail, set when rejected

    Admission() : allowed(false) {}

    static Admission allow(const std::string& normalized) {
        Admission a;
        a.allowed = true;
        a.query = normalized;
        return a;
    }

    static Admission reject(const std::string& why) {
        Admission a;
        a.allowed = false;
        a.reason = why;
        return a;
    }
};

class AdmissionFilter {
public:
    static Admission admit(const std::string& query);

    // Uppercase keywords matched as substrings
    static const std::vector<std::string>& denied_keywords();

    // The only text a caller ever sees for a rejection
    static const char* rejection_message() { return "forbidden keywords"; }

private:
    static std::string strip_terminator(const std::string& trimmed);
};

} // namespace sqlgate

#endif // sqlgate_VALIDATOR_ADMISSION_HPP
