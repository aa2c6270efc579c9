#include "evalbox/proc_status_file.hh"
#include "evalbox/errmsg.hh"
#include "evalbox/file_contents.hh"
#include "evalbox/macros/throw.hh"

#include <cerrno>
#include <charconv>
#include <string>

FileDescriptor open_proc_status(pid_t pid) noexcept {
    if (pid == 0) {
        return FileDescriptor{"/proc/self/status", O_RDONLY | O_CLOEXEC};
    }
    // Enough for "/proc/" + any pid + "/status" and the null terminator
    char path[32] = "/proc/";
    auto [end, ec] = std::to_chars(path + 6, path + sizeof(path) - 8, pid);
    if (ec != std::errc{}) {
        errno = EINVAL;
        return FileDescriptor{};
    }
    std::string_view suffix = "/status";
    suffix.copy(end, suffix.size());
    end[suffix.size()] = '\0';
    return FileDescriptor{path, O_RDONLY | O_CLOEXEC};
}

std::string field_from_proc_status(int proc_status_fd, std::string_view field_name) {
    if (lseek(proc_status_fd, 0, SEEK_SET) == -1) {
        THROW("lseek()", errmsg());
    }
    std::string contents = get_file_contents(proc_status_fd);
    std::string_view rest = contents;
    while (not rest.empty()) {
        auto line_end = rest.find('\n');
        auto line = rest.substr(0, line_end);
        rest.remove_prefix(line_end == std::string_view::npos ? rest.size() : line_end + 1);

        if (line.size() <= field_name.size() or line.substr(0, field_name.size()) != field_name or
            line[field_name.size()] != ':')
        {
            continue;
        }
        line.remove_prefix(field_name.size() + 1);
        // Skip white space
        while (not line.empty() and (line.front() == ' ' or line.front() == '\t')) {
            line.remove_prefix(1);
        }
        return std::string{line};
    }
    THROW("field \"", field_name, "\" was not found");
}

uint64_t proc_status_memory_in_bytes(std::string_view field_value) {
    uint64_t val = 0;
    auto [ptr, ec] =
        std::from_chars(field_value.data(), field_value.data() + field_value.size(), val);
    if (ec != std::errc{}) {
        THROW("invalid memory field value: ", field_value);
    }
    std::string_view unit{ptr, static_cast<size_t>(field_value.data() + field_value.size() - ptr)};
    if (unit != " kB") {
        THROW("invalid memory field unit: ", field_value);
    }
    return val << 10;
}
