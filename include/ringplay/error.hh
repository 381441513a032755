// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <stdexcept>
#include <string>

namespace ringplay {

/**
 * @brief Base exception class for all ringplay errors
 *
 * All ringplay-specific exceptions derive from this class, making it easy
 * to catch all ringplay errors with a single catch block.
 */
class ringplay_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Configuration errors
 *
 * Thrown at setup time and never recovered from at runtime:
 * - Ring capacity not a whole number of blocks
 * - Zero channels, frames or blocks
 * - A read request larger than the ring capacity
 */
class config_error : public ringplay_error {
public:
    using ringplay_error::ringplay_error;
};

/**
 * @brief Compute engine failures
 *
 * Thrown by compute_engine::process_block(). The producer catches it,
 * abandons the current fill without committing the failed block and
 * reports it through the diagnostics channel.
 */
class compute_error : public ringplay_error {
public:
    using ringplay_error::ringplay_error;
};

/**
 * @brief Audio device related errors
 *
 * Thrown when device operations fail, such as:
 * - Device not found
 * - Device initialization failure
 * - Invalid device handle
 */
class device_error : public ringplay_error {
public:
    using ringplay_error::ringplay_error;
};

/**
 * @brief State related errors
 *
 * Thrown when operations are attempted in invalid states, such as:
 * - Producing into a ring that has no room for a block
 * - Starting a session twice
 */
class state_error : public ringplay_error {
public:
    using ringplay_error::ringplay_error;
};

} // namespace ringplay

/*
 * Copyright (C) 2025
 *
 * This file is part of ringplay.
 *
 * ringplay is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * ringplay is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with ringplay.  If not, see <http://www.gnu.org/licenses/>.
 */
