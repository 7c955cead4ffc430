// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pagewright::internal {

enum class DrawStateType : uint8_t {
    SaveState,
    Text,
};

// Accumulates content stream operators. Nesting of q/Q and BT/ET is tracked
// so that unbalanced streams are caught before they are written out.
class CommandStreamFormatter {

public:
    CommandStreamFormatter() = default;

    void append(std::string_view line_of_text);
    void append_command(double arg, const char *command);
    void append_command(double arg1, double arg2, const char *command);
    void append_command(double arg1, double arg2, double arg3, double arg4, const char *command);
    void append_command(
        double a, double b, double c, double d, double e, double f, const char *command);
    // Colors are written with three decimals.
    void append_color_command(double r, double g, double b, const char *command);

    rvoe<NoReturnValue> BT();
    rvoe<NoReturnValue> ET();

    rvoe<NoReturnValue> q();
    rvoe<NoReturnValue> Q();

    rvoe<std::string> steal();

private:
    rvoe<NoReturnValue> indent(DrawStateType stype);
    rvoe<NoReturnValue> dedent(DrawStateType stype);
    bool has_state(DrawStateType stype) const;

    std::string lead;
    std::vector<DrawStateType> stack;
    std::string buf;
};

} // namespace pagewright::internal
