#ifndef KGSCORE_OPTIONS_H
#define KGSCORE_OPTIONS_H

#include "common/datatypes.h"
#include "reporting/logger.h"

// ENUM values
enum class ScoreFunctionType { TRANSE, ROTATE, OTE };

ScoreFunctionType getScoreFunctionType(std::string string_val);

std::string scoreFunctionTypeToString(ScoreFunctionType type);

/**
 * Transformation applied to the scale column of OTE relation blocks.
 * NONE: relation blocks carry no scale column.
 * ABS: scale is the absolute value of the raw column.
 * EXP: scale is the exponential of the raw column.
 */
enum class ScaleType { NONE, ABS, EXP };

ScaleType getScaleType(std::string string_val);

ScaleType getScaleType(int code);

spdlog::level::level_enum getLogLevel(std::string string_val);

struct ScoreFunctionOptions {
    float gamma = 12.0;

    ScoreFunctionOptions(){};
    ScoreFunctionOptions(float gamma) : gamma(gamma){};
    virtual ~ScoreFunctionOptions() = default;
};

struct RotatEOptions : ScoreFunctionOptions {
    // relation values in [-phase_scale, phase_scale] map onto angles in [-pi, pi]
    float phase_scale = M_PI;

    RotatEOptions(){};
    RotatEOptions(float gamma, float phase_scale) : ScoreFunctionOptions(gamma), phase_scale(phase_scale){};
};

struct OTEOptions : ScoreFunctionOptions {
    int num_elem = 1;
    ScaleType scale_type = ScaleType::NONE;

    OTEOptions(){};
    OTEOptions(float gamma, int num_elem, ScaleType scale_type) : ScoreFunctionOptions(gamma), num_elem(num_elem), scale_type(scale_type){};
};

#endif  // KGSCORE_OPTIONS_H
