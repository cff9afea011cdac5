#include "engine/Provisioner.hpp"

#include "utils/Log.hpp"

namespace rotor::engine
{

ProvisionResult PassiveProvisioner::start_session(Account const &account)
{
    ROTOR_LOG_DEBUG("passive provisioner: session on {} assumed started",
                    account.id);
    return ProvisionResult::success();
}

ProvisionResult PassiveProvisioner::stop_session(Account const &account)
{
    ROTOR_LOG_DEBUG("passive provisioner: session on {} assumed stopped",
                    account.id);
    return ProvisionResult::success();
}

ProvisionResult PassiveProvisioner::health_check(Account const &)
{
    return ProvisionResult::success();
}

} // namespace rotor::engine
