#pragma once

#include "evalbox/file_descriptor.hh"

#include <cstdint>
#include <string>
#include <string_view>
#include <sys/types.h>

// On error returns empty (not open) file descriptor and errno is set by open()
FileDescriptor open_proc_status(pid_t pid) noexcept;

// Returns contents of the field @p field_name from @p proc_status_fd
// E.g. requesting "VmSize" from file with line "VmSize:  19096 kB" will return
// "19096 kB"
// On error throws std::runtime_error
std::string field_from_proc_status(int proc_status_fd, std::string_view field_name);

// Converts a memory field value e.g. "19096 kB" to bytes. Throws std::runtime_error on
// invalid value.
uint64_t proc_status_memory_in_bytes(std::string_view field_value);
