#ifndef KGSCORE_CONFIG_H
#define KGSCORE_CONFIG_H

#include "common/datatypes.h"
#include "options.h"

using std::shared_ptr;

struct ScoreFunctionConfig {
    ScoreFunctionType type;
    shared_ptr<ScoreFunctionOptions> options = nullptr;
    bool check_numerics = false;

    ScoreFunctionConfig(){};
    ScoreFunctionConfig(ScoreFunctionType type, shared_ptr<ScoreFunctionOptions> options, bool check_numerics = false)
        : type(type), options(options), check_numerics(check_numerics){};
};

/**
 * Builds a score function config from flat key/value hyperparameters.
 * Recognized keys: score, gamma, phase_scale, ote_size, scale_type, check_numerics.
 * Missing keys keep the defaults of the matching options struct, unknown keys and unparsable values throw.
 */
shared_ptr<ScoreFunctionConfig> initScoreFunctionConfig(const map<string, string> &values);

#endif  // KGSCORE_CONFIG_H
