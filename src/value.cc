#include "evalbox/value.hh"
#include "evalbox/macros/throw.hh"

#include <cstdint>
#include <cstring>
#include <limits>

namespace {

using len_t = uint32_t;

void append_len(std::string& buff, size_t len) {
    if (len > std::numeric_limits<len_t>::max()) {
        THROW("value is too big to be encoded: ", len);
    }
    auto x = static_cast<len_t>(len);
    buff.append(reinterpret_cast<const char*>(&x), sizeof(x));
}

class Reader {
    std::string_view data_;

public:
    explicit Reader(std::string_view data) noexcept : data_{data} {}

    len_t read_len() {
        if (data_.size() < sizeof(len_t)) {
            THROW("truncated value: expected a length");
        }
        len_t x{};
        std::memcpy(&x, data_.data(), sizeof(x));
        data_.remove_prefix(sizeof(x));
        return x;
    }

    std::string_view read_bytes(len_t len) {
        if (data_.size() < len) {
            THROW("truncated value: expected ", len, " bytes, got ", data_.size());
        }
        auto res = data_.substr(0, len);
        data_.remove_prefix(len);
        return res;
    }

    [[nodiscard]] size_t remaining() const noexcept { return data_.size(); }
};

} // namespace

namespace evalbox {

std::string Value::to_string() const {
    std::string res = "{";
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0) {
            res += ", ";
        }
        res += '{';
        for (size_t j = 0; j < results[i].size(); ++j) {
            if (j > 0) {
                res += ", ";
            }
            res += results[i][j];
        }
        res += '}';
    }
    res += '}';
    return res;
}

std::string Value::encode() const {
    std::string buff;
    append_len(buff, results.size());
    for (const auto& result_set : results) {
        append_len(buff, result_set.size());
        for (const auto& fact : result_set) {
            append_len(buff, fact.size());
            buff += fact;
        }
    }
    return buff;
}

Value decode_value(std::string_view encoded) {
    Reader reader{encoded};
    Value value;
    auto results_num = reader.read_len();
    // Every result set takes at least sizeof(len_t) bytes
    if (results_num > reader.remaining() / sizeof(len_t)) {
        THROW("malformed value: too many result sets: ", results_num);
    }
    value.results.reserve(results_num);
    for (len_t i = 0; i < results_num; ++i) {
        auto facts_num = reader.read_len();
        if (facts_num > reader.remaining() / sizeof(len_t)) {
            THROW("malformed value: too many facts: ", facts_num);
        }
        auto& result_set = value.results.emplace_back();
        result_set.reserve(facts_num);
        for (len_t j = 0; j < facts_num; ++j) {
            result_set.emplace_back(reader.read_bytes(reader.read_len()));
        }
    }
    if (reader.remaining() != 0) {
        THROW("malformed value: ", reader.remaining(), " trailing bytes");
    }
    return value;
}

} // namespace evalbox
