#pragma once

#include "pcomb.h"

// Finds "<quantity> ... eggs|chickens" in free text, e.g.
// "i would like 12 large eggs please". The value of a successful run is
// {"quantity": 12, "item": "eggs"}. Noise before, between and after the
// two signals is consumed.
pcomb_parser common_signal_grammar();
