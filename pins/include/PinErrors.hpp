// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <stdexcept>

struct PinError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Function outside of input/output
struct PinInvalidFunction : PinError {
  using PinError::PinError;
};

// Digital write on an input
struct PinSetInput : PinError {
  using PinError::PinError;
};

// Pull change on a non-input, or against a physical pull resistor
struct PinFixedPull : PinError {
  using PinError::PinError;
};

struct PinInvalidPull : PinError {
  using PinError::PinError;
};

struct PinInvalidState : PinError {
  using PinError::PinError;
};

struct PinInvalidBounce : PinError {
  using PinError::PinError;
};

struct PinInvalidEdges : PinError {
  using PinError::PinError;
};

struct PinInvalidFrequency : PinError {
  using PinError::PinError;
};

// PWM can't be started on the line
struct PinPWMFixedValue : PinError {
  using PinError::PinError;
};

struct PinEdgeDetectFailed : PinError {
  using PinError::PinError;
};

struct PinClosed : PinError {
  using PinError::PinError;
};
