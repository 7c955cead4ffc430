// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <commandstreamformatter.hpp>

#include <fmt/core.h>

#include <iterator>

namespace pagewright::internal {

void CommandStreamFormatter::append(std::string_view line_of_text) {
    if(!line_of_text.empty()) {
        buf += lead;
        buf += line_of_text;
        if(buf.back() != '\n') {
            buf += '\n';
        }
    }
}

void CommandStreamFormatter::append_command(double arg, const char *command) {
    fmt::format_to(std::back_inserter(buf), "{}{:f} {}\n", lead, arg, command);
}

void CommandStreamFormatter::append_command(double arg1, double arg2, const char *command) {
    fmt::format_to(std::back_inserter(buf), "{}{:f} {:f} {}\n", lead, arg1, arg2, command);
}

void CommandStreamFormatter::append_command(
    double arg1, double arg2, double arg3, double arg4, const char *command) {
    fmt::format_to(std::back_inserter(buf),
                   "{}{:f} {:f} {:f} {:f} {}\n",
                   lead,
                   arg1,
                   arg2,
                   arg3,
                   arg4,
                   command);
}

void CommandStreamFormatter::append_command(
    double a, double b, double c, double d, double e, double f, const char *command) {
    fmt::format_to(std::back_inserter(buf),
                   "{}{:f} {:f} {:f} {:f} {:f} {:f} {}\n",
                   lead,
                   a,
                   b,
                   c,
                   d,
                   e,
                   f,
                   command);
}

void CommandStreamFormatter::append_color_command(double r,
                                                  double g,
                                                  double b,
                                                  const char *command) {
    fmt::format_to(std::back_inserter(buf), "{}{:.3f} {:.3f} {:.3f} {}\n", lead, r, g, b, command);
}

rvoe<NoReturnValue> CommandStreamFormatter::BT() {
    append("BT");
    ERCV(indent(DrawStateType::Text));
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::ET() {
    ERCV(dedent(DrawStateType::Text));
    append("ET");
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::q() {
    append("q");
    ERCV(indent(DrawStateType::SaveState));
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::Q() {
    ERCV(dedent(DrawStateType::SaveState));
    append("Q");
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::indent(DrawStateType stype) {
    if(stype == DrawStateType::Text && has_state(stype)) {
        RETERR(DrawStateEndMismatch);
    }
    stack.push_back(stype);
    lead += "  ";
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::dedent(DrawStateType stype) {
    if(stack.empty() || stack.back() != stype) {
        RETERR(DrawStateEndMismatch);
    }
    stack.pop_back();
    lead.pop_back();
    lead.pop_back();
    RETOK;
}

bool CommandStreamFormatter::has_state(DrawStateType stype) const {
    for(const auto e : stack) {
        if(e == stype)
            return true;
    }
    return false;
}

rvoe<std::string> CommandStreamFormatter::steal() {
    if(!stack.empty()) {
        RETERR(DrawStateEndMismatch);
    }
    std::string tmpres = std::move(buf);
    buf.clear();
    return tmpres;
}

} // namespace pagewright::internal
