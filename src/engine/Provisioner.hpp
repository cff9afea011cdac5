#pragma once

#include "engine/Core.hpp"

#include <string>

namespace rotor::engine
{

struct ProvisionResult
{
    bool ok = true;
    std::string error;
    // Fatal failures (revoked credentials, banned account) skip the retry
    // budget and suspend the account at once.
    bool fatal = false;

    static ProvisionResult success() { return {}; }
    static ProvisionResult failure(std::string error, bool fatal = false)
    {
        return {false, std::move(error), fatal};
    }
};

// Creates, tears down and health-checks the remote session behind an account.
// Calls run on provisioning worker threads and may block.
class Provisioner
{
  public:
    virtual ~Provisioner() = default;

    virtual ProvisionResult start_session(Account const &account) = 0;
    virtual ProvisionResult stop_session(Account const &account) = 0;
    virtual ProvisionResult health_check(Account const &account) = 0;
};

// For sessions opened and closed outside this process: every call
// succeeds, so rotation bookkeeping runs without touching a provider.
class PassiveProvisioner final : public Provisioner
{
  public:
    ProvisionResult start_session(Account const &account) override;
    ProvisionResult stop_session(Account const &account) override;
    ProvisionResult health_check(Account const &account) override;
};

} // namespace rotor::engine
