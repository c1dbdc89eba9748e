/*
 * sqlgate - Process jail (Landlock)
 *
 * Validation never needs the filesystem: every database lives in memory and
 * requests arrive on stdin. Once startup has read its config, the process
 * drops all filesystem write access and keeps read-only access to system
 * library directories. An engine-level escape (ATTACH, VACUUM INTO, ...)
 * then has nowhere to write.
 */
#ifndef sqlgate_CORE_JAIL_HPP
#define sqlgate_CORE_JAIL_HPP

namespace sqlgate {

class ProcessJail {
public:
    static ProcessJail& instance();

    // Returns true on success or if already active. Returns false if
    // Landlock is unavailable or setup failed; the caller decides policy.
    bool activate();

private:
    ProcessJail();
    ProcessJail(const ProcessJail&);
    ProcessJail& operator=(const ProcessJail&);

    bool active_;
    int abi_version_;           // 0 when Landlock is unavailable
};

} // namespace sqlgate

#endif // sqlgate_CORE_JAIL_HPP
