#pragma once
#include <memory>
#include <string>

// "Is the provider terminal up and authenticated?" The dispatcher only asks; it never
// manages the terminal.
struct IProviderReadiness
{
    virtual ~IProviderReadiness() = default;
    virtual bool ready() = 0;
};

// GET probe_url; ready on HTTP 200.
std::unique_ptr<IProviderReadiness> make_http_readiness(std::string probe_url, long timeout_s = 5);
