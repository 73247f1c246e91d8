// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "tt_reset/utils/semver.hpp"

namespace tt::reset {

/**
 * Oldest KMD the reset flow is supported on. Older drivers lack the reset ioctl flags used to take the PCIe link
 * down and restore config space afterwards.
 */
inline constexpr SemVer KMD_MIN_RESET = SemVer(1, 26, 0);

/**
 * KMD version 2.4.1 introduced architecture agnostic reset support. With the new IOCTL in KMD 2.4.1 the same
 * IOCTL resets different architectures without architecture specific register sequences in user space.
 */
inline constexpr SemVer KMD_ARCH_AGNOSTIC_RESET = SemVer{2, 4, 1};

}  // namespace tt::reset
