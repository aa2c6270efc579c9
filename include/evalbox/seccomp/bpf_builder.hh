#pragma once

#include "evalbox/errmsg.hh"
#include "evalbox/file_descriptor.hh"
#include "evalbox/macros/throw.hh"

#include <cstdint>
#include <seccomp.h>
#include <sys/mman.h>
#include <utility>

namespace evalbox::seccomp {

// Matches if (syscall argument & mask) == datum
#define DECLARE_FOR_ARG(arg_num)      \
    struct ARG##arg_num##_MASKED_EQ { \
        uint64_t mask;                \
        uint64_t datum;               \
    };

DECLARE_FOR_ARG(0)
DECLARE_FOR_ARG(1)
DECLARE_FOR_ARG(2)
#undef DECLARE_FOR_ARG

// Builds a classic BPF seccomp program; the program is loaded by whoever receives the exported fd
class BpfBuilder {
    scmp_filter_ctx seccomp_ctx;

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wc99-extensions"
#pragma clang diagnostic ignored "-Wmissing-field-initializers"
#endif

#define DEFINE_FOR_ARG(arg_num)                                                             \
    static constexpr auto arg_cmp_to_seccomp_native(const ARG##arg_num##_MASKED_EQ& arg_cmp \
    ) noexcept {                                                                            \
        return SCMP_A##arg_num(SCMP_CMP_MASKED_EQ, arg_cmp.mask, arg_cmp.datum);            \
    }

    DEFINE_FOR_ARG(0)
    DEFINE_FOR_ARG(1)
    DEFINE_FOR_ARG(2)
#undef DEFINE_FOR_ARG

#ifdef __clang__
#pragma clang diagnostic pop
#endif

    template <class... Args>
    void add_rule(uint32_t action, int syscall, Args&&... args) {
        int err = seccomp_rule_add(
            seccomp_ctx,
            action,
            syscall,
            sizeof...(args),
            arg_cmp_to_seccomp_native(std::forward<Args>(args))...
        );
        if (err) {
            THROW("seccomp_rule_add()", errmsg(-err));
        }
    }

public:
    explicit BpfBuilder(uint32_t def_action) : seccomp_ctx{seccomp_init(def_action)} {
        if (!seccomp_ctx) {
            THROW("seccomp_init() failed");
        }

        // Enable binary tree sorted syscalls in the filter
        int err = seccomp_attr_set(seccomp_ctx, SCMP_FLTATR_CTL_OPTIMIZE, 2);
        if (err) {
            seccomp_release(seccomp_ctx);
            THROW("seccomp_attr_set()", errmsg(-err));
        }
    }

    BpfBuilder(const BpfBuilder&) = delete;
    BpfBuilder(BpfBuilder&&) = delete;
    BpfBuilder& operator=(const BpfBuilder&) = delete;
    BpfBuilder& operator=(BpfBuilder&&) = delete;

    // Makes @p syscall fail with @p errnum if all argument comparisons @p args match
    template <class... Args>
    void err_syscall(int errnum, int syscall, Args&&... args) {
        add_rule(SCMP_ACT_ERRNO(errnum), syscall, std::forward<Args>(args)...);
    }

    // Returns a memfd holding the program, with the file offset at its end
    [[nodiscard]] FileDescriptor export_to_fd() const {
        auto mfd = FileDescriptor{memfd_create("seccomp bpf", MFD_CLOEXEC)};
        if (!mfd.is_open()) {
            THROW("memfd_create()", errmsg());
        }

        int err = seccomp_export_bpf(seccomp_ctx, mfd);
        if (err) {
            THROW("seccomp_export_bpf()", errmsg(-err));
        }

        return mfd;
    }

    ~BpfBuilder() { seccomp_release(seccomp_ctx); }
};

} // namespace evalbox::seccomp
