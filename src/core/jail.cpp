/*
 * sqlgate - Process jail implementation (Landlock)
 *
 * Landlock is unprivileged and available since Linux 5.13. The ruleset
 * handles every filesystem right the running kernel knows about (queried
 * through the ABI version), so newer rights such as truncate are denied
 * too. Without Landlock the jail degrades to a warning.
 */
#include <sqlgate/core/jail.hpp>
#include <sqlgate/core/logger.hpp>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <sys/prctl.h>
#include <unistd.h>

#ifdef __linux__
#include <linux/landlock.h>
#include <sys/syscall.h>

// Older libc headers lack the syscall numbers
#ifndef SYS_landlock_create_ruleset
#define SYS_landlock_create_ruleset 444
#endif
#ifndef SYS_landlock_add_rule
#define SYS_landlock_add_rule 445
#endif
#ifndef SYS_landlock_restrict_self
#define SYS_landlock_restrict_self 446
#endif
#endif

namespace sqlgate {

#ifdef __linux__

namespace {

// Closes on scope exit
class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) ::close(fd_);
    }
    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    ScopedFd(const ScopedFd&);
    ScopedFd& operator=(const ScopedFd&);

    int fd_;
};

int ll_create_ruleset(const struct landlock_ruleset_attr* attr, size_t size, uint32_t flags) {
    return static_cast<int>(syscall(SYS_landlock_create_ruleset, attr, size, flags));
}

int ll_add_rule(int ruleset_fd, const struct landlock_path_beneath_attr* attr) {
    return static_cast<int>(syscall(SYS_landlock_add_rule, ruleset_fd,
                                    LANDLOCK_RULE_PATH_BENEATH, attr, 0));
}

int ll_restrict_self(int ruleset_fd) {
    return static_cast<int>(syscall(SYS_landlock_restrict_self, ruleset_fd, 0));
}

// Rights present since ABI 1
const uint64_t FS_RIGHTS_V1 =
    LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE |
    LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR |
    LANDLOCK_ACCESS_FS_REMOVE_DIR | LANDLOCK_ACCESS_FS_REMOVE_FILE |
    LANDLOCK_ACCESS_FS_MAKE_CHAR | LANDLOCK_ACCESS_FS_MAKE_DIR |
    LANDLOCK_ACCESS_FS_MAKE_REG | LANDLOCK_ACCESS_FS_MAKE_SOCK |
    LANDLOCK_ACCESS_FS_MAKE_FIFO | LANDLOCK_ACCESS_FS_MAKE_BLOCK |
    LANDLOCK_ACCESS_FS_MAKE_SYM;

const uint64_t FS_READ_ONLY =
    LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR;

uint64_t handled_rights_for_abi(int abi) {
    uint64_t rights = FS_RIGHTS_V1;
#ifdef LANDLOCK_ACCESS_FS_REFER
    if (abi >= 2) rights |= LANDLOCK_ACCESS_FS_REFER;
#endif
#ifdef LANDLOCK_ACCESS_FS_TRUNCATE
    if (abi >= 3) rights |= LANDLOCK_ACCESS_FS_TRUNCATE;
#endif
    (void)abi;
    return rights;
}

} // namespace

#endif // __linux__

ProcessJail& ProcessJail::instance() {
    static ProcessJail jail;
    return jail;
}

ProcessJail::ProcessJail()
    : active_(false)
    , abi_version_(0)
{
#ifdef __linux__
    int abi = ll_create_ruleset(nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
    abi_version_ = abi > 0 ? abi : 0;
#endif
}

bool ProcessJail::activate() {
    if (active_) return true;

#ifndef __linux__
    LOG_WARN("[Jail] Landlock is only available on Linux. Jail NOT active.");
    return false;
#else
    if (abi_version_ == 0) {
        LOG_WARN("[Jail] Landlock not supported by this kernel. Jail NOT active.");
        return false;
    }

    struct landlock_ruleset_attr ruleset_attr;
    memset(&ruleset_attr, 0, sizeof(ruleset_attr));
    ruleset_attr.handled_access_fs = handled_rights_for_abi(abi_version_);

    ScopedFd ruleset(ll_create_ruleset(&ruleset_attr, sizeof(ruleset_attr), 0));
    if (!ruleset.valid()) {
        LOG_ERROR("[Jail] Failed to create Landlock ruleset: %s", strerror(errno));
        return false;
    }

    // Shared libraries, locale and timezone data
    const char* const read_only[] = { "/usr", "/lib", "/lib64", "/etc" };

    for (size_t i = 0; i < sizeof(read_only) / sizeof(read_only[0]); ++i) {
        ScopedFd dir(open(read_only[i], O_PATH | O_CLOEXEC));
        if (!dir.valid()) {
            LOG_DEBUG("[Jail] Skipping missing path %s", read_only[i]);
            continue;
        }

        struct landlock_path_beneath_attr rule;
        memset(&rule, 0, sizeof(rule));
        rule.allowed_access = FS_READ_ONLY;
        rule.parent_fd = dir.get();
        if (ll_add_rule(ruleset.get(), &rule) != 0) {
            LOG_WARN("[Jail] Could not grant R/O access to %s: %s",
                     read_only[i], strerror(errno));
        }
    }

    // Unprivileged processes must set no_new_privs before restricting
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        LOG_ERROR("[Jail] Failed to set no_new_privs: %s", strerror(errno));
        return false;
    }

    if (ll_restrict_self(ruleset.get()) != 0) {
        LOG_ERROR("[Jail] Failed to restrict self: %s", strerror(errno));
        return false;
    }

    active_ = true;
    LOG_INFO("[Jail] Landlock ABI v%d active: filesystem is read-only, system directories only",
             abi_version_);
    return true;
#endif // __linux__
}

} // namespace sqlgate
