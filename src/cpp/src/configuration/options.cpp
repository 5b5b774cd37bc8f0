#include "configuration/options.h"

ScoreFunctionType getScoreFunctionType(std::string string_val) {
    for (auto& c : string_val) c = toupper(c);

    if (string_val == "TRANSE") {
        return ScoreFunctionType::TRANSE;
    } else if (string_val == "ROTATE") {
        return ScoreFunctionType::ROTATE;
    } else if (string_val == "OTE") {
        return ScoreFunctionType::OTE;
    } else {
        throw UnsupportedConfigurationException("Unrecognized score function string: " + string_val);
    }
}

std::string scoreFunctionTypeToString(ScoreFunctionType type) {
    switch (type) {
        case ScoreFunctionType::TRANSE:
            return "TransE";
        case ScoreFunctionType::ROTATE:
            return "RotatE";
        case ScoreFunctionType::OTE:
            return "OTE";
    }
    throw UnsupportedConfigurationException("Unrecognized score function type");
}

ScaleType getScaleType(std::string string_val) {
    for (auto& c : string_val) c = toupper(c);

    if (string_val == "NONE" || string_val == "0") {
        return ScaleType::NONE;
    } else if (string_val == "ABS" || string_val == "1") {
        return ScaleType::ABS;
    } else if (string_val == "EXP" || string_val == "2") {
        return ScaleType::EXP;
    } else {
        throw UnsupportedConfigurationException("Unrecognized scale type string: " + string_val);
    }
}

ScaleType getScaleType(int code) {
    switch (code) {
        case 0:
            return ScaleType::NONE;
        case 1:
            return ScaleType::ABS;
        case 2:
            return ScaleType::EXP;
        default:
            throw UnsupportedConfigurationException("Scale type " + std::to_string(code) + " is not supported");
    }
}

spdlog::level::level_enum getLogLevel(std::string string_val) {
    for (auto& c : string_val) c = toupper(c);

    if (string_val == "ERROR" || string_val == "E") {
        return spdlog::level::err;
    } else if (string_val == "WARN" || string_val == "W") {
        return spdlog::level::warn;
    } else if (string_val == "INFO" || string_val == "I") {
        return spdlog::level::info;
    } else if (string_val == "DEBUG" || string_val == "D") {
        return spdlog::level::debug;
    } else if (string_val == "TRACE" || string_val == "T") {
        return spdlog::level::trace;
    } else {
        throw UnsupportedConfigurationException("Unrecognized log level string: " + string_val);
    }
}
