#include <sqlgate/validator/validator.hpp>
#include <sqlgate/validator/admission.hpp>
#include <sqlgate/core/logger.hpp>
#include <sqlgate/core/utils.hpp>

#include <exception>

namespace sqlgate {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AdmissionRejected: return "AdmissionRejected";
        case ErrorKind::SeedFailure: return "SeedFailure";
        case ErrorKind::ExecutionFailure: return "ExecutionFailure";
        case ErrorKind::TimeoutExceeded: return "TimeoutExceeded";
        case ErrorKind::InternalFault: return "InternalFault";
        default: return "Unknown";
    }
}

Validator::Validator(const QueryExecutor& executor) : executor_(executor) {}

Verdict Validator::validate(const ValidationRequest& request) const {
    // Fingerprint instead of raw text keeps user SQL out of info-level logs
    const std::string fingerprint = sha256_hex(request.query).substr(0, 12);

    Admission admission = AdmissionFilter::admit(request.query);
    if (!admission.allowed) {
        LOG_INFO("[Validator] Rejected query %s: %s", fingerprint.c_str(), admission.reason.c_str());
        return Verdict::failure(ErrorKind::AdmissionRejected, AdmissionFilter::rejection_message());
    }

    LOG_DEBUG("[Validator] Admitted query %s: %s", fingerprint.c_str(),
              log_preview(admission.query).c_str());

    const int64_t started = monotonic_ms();
    Verdict verdict;
    try {
        verdict = executor_.execute(admission.query, request.seed_statements);
    } catch (const std::exception& e) {
        LOG_ERROR("[Validator] Sandbox fault for query %s: %s", fingerprint.c_str(), e.what());
        return Verdict::failure(ErrorKind::InternalFault, std::string("internal error: ") + e.what());
    }
    const long long elapsed = static_cast<long long>(monotonic_ms() - started);

    if (verdict.ok) {
        LOG_DEBUG("[Validator] Query %s ok: %zu rows%s in %lld ms", fingerprint.c_str(),
                  verdict.rows.size(), verdict.truncated ? " (truncated)" : "", elapsed);
    } else if (verdict.kind == ErrorKind::InternalFault) {
        LOG_ERROR("[Validator] Query %s internal fault: %s", fingerprint.c_str(), verdict.message.c_str());
    } else {
        LOG_DEBUG("[Validator] Query %s failed (%s) in %lld ms: %s", fingerprint.c_str(),
                  error_kind_name(verdict.kind), elapsed, verdict.message.c_str());
    }
    return verdict;
}

} // namespace sqlgate
