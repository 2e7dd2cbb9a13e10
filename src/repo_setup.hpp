/// \file repo_setup.hpp \brief Preparation steps that must succeed before
/// the commit scheduling starts

#ifndef REPO_SETUP_HPP
#define REPO_SETUP_HPP

#include "program_state.hpp"

/// \brief Check that ruleset and output locations are usable. Throws
/// `setup_error`.
void validate_config(CP<miner_config> config);

/// \brief Clone `config->repo` into the base repository directory, or
/// fetch the latest state if the clone exists from the previous run.
/// Returns path to the base repository. Throws `setup_error`.
Path prepare_repository(CP<miner_config> config, SPtr<Logger> logger);

#endif // REPO_SETUP_HPP
