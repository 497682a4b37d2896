#pragma once

#include "utils/logger_sinks/sink.hpp"

namespace syncdesk::utils
{

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg, Sink::WRITE_MODE mode) override
    {
        fmt::print(stderr, "{}", Sink::format_logmsg(msg, mode));
    }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

} // namespace syncdesk::utils
