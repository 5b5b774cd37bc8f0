#include "configuration/config.h"

#include <set>

namespace {
const std::set<string> known_keys = {"score", "gamma", "phase_scale", "ote_size", "scale_type", "check_numerics"};

template <typename T>
T cast_helper(const string &key, const string &value);

template <>
float cast_helper<float>(const string &key, const string &value) {
    try {
        size_t pos;
        float ret = std::stof(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return ret;
    } catch (const std::logic_error &) {
        throw UnsupportedConfigurationException("Expected a float for " + key + ", got: " + value);
    }
}

template <>
int cast_helper<int>(const string &key, const string &value) {
    try {
        size_t pos;
        int ret = std::stoi(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return ret;
    } catch (const std::logic_error &) {
        throw UnsupportedConfigurationException("Expected an integer for " + key + ", got: " + value);
    }
}

template <>
bool cast_helper<bool>(const string &key, const string &value) {
    string lower = value;
    for (auto &c : lower) c = tolower(c);

    if (lower == "true" || lower == "1") {
        return true;
    } else if (lower == "false" || lower == "0") {
        return false;
    } else {
        throw UnsupportedConfigurationException("Expected a boolean for " + key + ", got: " + value);
    }
}
}  // namespace

shared_ptr<ScoreFunctionConfig> initScoreFunctionConfig(const map<string, string> &values) {
    for (auto &entry : values) {
        if (known_keys.find(entry.first) == known_keys.end()) {
            throw UnsupportedConfigurationException("Unknown score function option: " + entry.first);
        }
    }

    auto find = [&values](const string &key) -> const string * {
        auto itr = values.find(key);
        if (itr == values.end()) {
            return nullptr;
        }
        return &itr->second;
    };

    shared_ptr<ScoreFunctionConfig> ret_config = std::make_shared<ScoreFunctionConfig>();

    const string *score = find("score");
    ret_config->type = score == nullptr ? ScoreFunctionType::TRANSE : getScoreFunctionType(*score);

    shared_ptr<ScoreFunctionOptions> options;
    if (ret_config->type == ScoreFunctionType::ROTATE) {
        auto rotate_options = std::make_shared<RotatEOptions>();
        if (const string *phase_scale = find("phase_scale")) {
            rotate_options->phase_scale = cast_helper<float>("phase_scale", *phase_scale);
        }
        options = rotate_options;
    } else if (ret_config->type == ScoreFunctionType::OTE) {
        auto ote_options = std::make_shared<OTEOptions>();
        if (const string *ote_size = find("ote_size")) {
            ote_options->num_elem = cast_helper<int>("ote_size", *ote_size);
        }
        if (const string *scale_type = find("scale_type")) {
            ote_options->scale_type = getScaleType(*scale_type);
        }
        options = ote_options;
    } else {
        options = std::make_shared<ScoreFunctionOptions>();
    }

    if (const string *gamma = find("gamma")) {
        options->gamma = cast_helper<float>("gamma", *gamma);
    }
    ret_config->options = options;

    if (const string *check_numerics = find("check_numerics")) {
        ret_config->check_numerics = cast_helper<bool>("check_numerics", *check_numerics);
    }

    return ret_config;
}
