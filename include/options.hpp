#pragma once

#include "OptionParser.hpp"
#include "feature_table.hpp"
#include "multichr.hpp"
#include "transfer.hpp"

namespace opt {

// Translate the parsed command line into engine options
void init_opts(const AppConfig& cfg, transfer::TransferOpts& t, ftable::WriteOpts& w);
void init_opts(const AppConfig& cfg, multichr::MultiOpts& m);

// qualifier keys never copied unless asked for
inline constexpr const char* DEFAULT_EXCLUDED_QUAL = "^protein_id$";

} // namespace opt
