#pragma once

#include <cstdio>

#include <fmt/core.h>

#include "utils/logger_sinks/sink.hpp"

namespace kanbanhub::utils
{

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", render(msg)); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

} // namespace kanbanhub::utils
