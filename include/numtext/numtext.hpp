// include/numtext/numtext.hpp — Umbrella header that exposes numtext components.

#pragma once

// Umbrella header for numtext.
// Users should generally include only this file.

#include <numtext/core/alphabet.hpp>
#include <numtext/core/bit_conversion.hpp>
#include <numtext/io/batch.hpp>
#include <numtext/io/decimal.hpp>
#include <numtext/io/readable.hpp>
#include <numtext/util/debug.hpp>
#include <numtext/util/random.hpp>

namespace numtext {

    using Alphabet = core::alphabet;

    using io::friendly_window;
    using io::general_window;
    using io::no_limit;
    using io::notation;

} // namespace numtext
