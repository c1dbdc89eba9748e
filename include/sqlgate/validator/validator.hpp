/*
 * sqlgate - Validator
 *
 * Entry point for one validation call: admission, then execution in a fresh
 * sandbox. Never throws; every failure comes back as an Error verdict.
 */
#ifndef sqlgate_VALIDATOR_VALIDATOR_HPP
#define sqlgate_VALIDATOR_VALIDATOR_HPP

#include "types.hpp"
#include "sandbox.hpp"

namespace sqlgate {

class Validator {
public:
    explicit Validator(const QueryExecutor& executor);

    Verdict validate(const ValidationRequest& request) const;

private:
    const QueryExecutor& executor_;
};

} // namespace sqlgate

#endif // sqlgate_VALIDATOR_VALIDATOR_HPP
