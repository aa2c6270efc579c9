#include "evalbox/path.hh"
#include "evalbox/errmsg.hh"
#include "evalbox/macros/throw.hh"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <memory>
#include <unistd.h>

std::string path_absolute(std::string_view path, std::string_view curr_dir) {
    std::string res{path.starts_with('/') ? std::string_view{"/"} : curr_dir};
    auto erase_last_component = [&res] {
        auto pos = res.rfind('/');
        res.resize(pos == 0 ? 1 : pos);
    };
    auto append_component = [&res](std::string_view component) {
        if (res.empty() or res.back() != '/') {
            res += '/';
        }
        res += component;
    };

    for (size_t i = 0; i < path.size();) {
        if (path[i] == '/') {
            ++i;
            continue;
        }
        size_t next_slash_pos = std::min(path.find('/', i), path.size());
        auto component = path.substr(i, next_slash_pos - i);
        if (component == "..") {
            erase_last_component();
        } else if (component != ".") {
            append_component(component);
        }
        i = next_slash_pos;
    }

    if (res.empty()) {
        return "/";
    }
    if (res.size() > 1 and res.back() == '/') {
        res.pop_back();
    }
    return res;
}

std::string path_resolve_existing_prefix(const std::string& path) {
    // The prefix is resolved the way the kernel walks it: a symlink is followed before a
    // subsequent .. is applied
    std::string prefix = path;
    std::string suffix;
    for (;;) {
        std::unique_ptr<char, decltype(&free)> resolved{realpath(prefix.c_str(), nullptr), &free};
        if (resolved) {
            return path_absolute(suffix, resolved.get());
        }
        if (errno != ENOENT and errno != ENOTDIR and errno != EACCES) {
            THROW("realpath()", errmsg());
        }
        if (prefix == "/") {
            return path_absolute(path);
        }
        auto pos = prefix.rfind('/');
        auto component = prefix.substr(pos + 1);
        suffix = suffix.empty() ? component : component + '/' + suffix;
        prefix.resize(pos == 0 ? 1 : pos);
    }
}

bool path_is_within(std::string_view path, std::string_view subtree) noexcept {
    if (subtree == "/") {
        return path.starts_with('/');
    }
    return path.starts_with(subtree) and
        (path.size() == subtree.size() or path[subtree.size()] == '/');
}

std::string get_cwd() {
    std::unique_ptr<char, decltype(&free)> cwd{getcwd(nullptr, 0), &free};
    if (not cwd) {
        THROW("getcwd()", errmsg());
    }
    return cwd.get();
}
