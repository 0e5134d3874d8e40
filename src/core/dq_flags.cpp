#include "outlier_detect/core/dq_flags.hpp"
#include "outlier_detect/core/errors.hpp"
#include "outlier_detect/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace outlier_detect::dq {

namespace {

const std::map<std::string, uint32_t>& mnemonic_map() {
    static const std::map<std::string, uint32_t> kMap = {
        {"GOOD", GOOD},
        {"DO_NOT_USE", DO_NOT_USE},
        {"SATURATED", SATURATED},
        {"JUMP_DET", JUMP_DET},
        {"DROPOUT", DROPOUT},
        {"OUTLIER", OUTLIER},
        {"PERSISTENCE", PERSISTENCE},
        {"AD_FLOOR", AD_FLOOR},
        {"CHARGELOSS", CHARGELOSS},
        {"UNRELIABLE_ERROR", UNRELIABLE_ERROR},
        {"NON_SCIENCE", NON_SCIENCE},
        {"DEAD", DEAD},
        {"HOT", HOT},
        {"WARM", WARM},
        {"LOW_QE", LOW_QE},
        {"NO_FLAT_FIELD", NO_FLAT_FIELD},
        {"NO_GAIN_VALUE", NO_GAIN_VALUE},
        {"REFERENCE_PIXEL", REFERENCE_PIXEL},
    };
    return kMap;
}

bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

std::optional<uint32_t> flag_from_mnemonic(const std::string& name) {
    std::string key = core::trim(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    const auto& m = mnemonic_map();
    auto it = m.find(key);
    if (it == m.end()) return std::nullopt;
    return it->second;
}

std::optional<uint32_t> interpret_bit_flags(const std::string& flags) {
    std::string s = core::trim(flags);
    if (s.empty() || core::to_lower(s) == "none") {
        return std::nullopt;
    }

    bool invert = false;
    if (s[0] == '~') {
        invert = true;
        s = core::trim(s.substr(1));
        if (s.empty()) {
            throw ValidationError("bit flag specification '" + flags + "' has nothing after '~'");
        }
    }

    uint32_t value = 0;
    if (all_digits(s)) {
        try {
            unsigned long long v = std::stoull(s);
            if (v > 0xFFFFFFFFull) {
                throw ValidationError("bit flag value out of range: " + s);
            }
            value = static_cast<uint32_t>(v);
        } catch (const std::out_of_range&) {
            throw ValidationError("bit flag value out of range: " + s);
        }
    } else {
        std::string normalized = s;
        std::replace(normalized.begin(), normalized.end(), '+', ',');
        for (const auto& token : core::split(normalized, ',')) {
            const std::string t = core::trim(token);
            if (t.empty()) {
                throw ValidationError("empty mnemonic in bit flag specification '" + flags + "'");
            }
            if (all_digits(t)) {
                if (t.size() > 10 || std::stoull(t) > 0xFFFFFFFFull) {
                    throw ValidationError("bit flag value out of range: " + t);
                }
                value |= static_cast<uint32_t>(std::stoull(t));
                continue;
            }
            auto flag = flag_from_mnemonic(t);
            if (!flag) {
                throw ValidationError("unknown DQ mnemonic '" + t + "'");
            }
            value |= *flag;
        }
    }

    return invert ? ~value : value;
}

Matrix2Df build_good_mask(const DQMatrix& dq, const std::optional<uint32_t>& good_bits) {
    if (!good_bits) {
        return Matrix2Df::Ones(dq.rows(), dq.cols());
    }
    const uint32_t bad = ~(*good_bits);
    Matrix2Df mask(dq.rows(), dq.cols());
    for (Eigen::Index i = 0; i < dq.size(); ++i) {
        mask.data()[i] = (dq.data()[i] & bad) == 0u ? 1.0f : 0.0f;
    }
    return mask;
}

} // namespace outlier_detect::dq
