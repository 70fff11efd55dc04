#include "kvmpp/session/session_context.hpp"
#include "kvmpp/log/logger.hpp"

namespace kvmpp {

SessionContext::SessionContext(SessionContextConfig config)
    : totp_(std::move(config.totp_generator), std::move(config.totp))
    , registry_(totp_, std::move(config.registry))
    , close_on_destroy_(config.close_on_destroy)
{
    if (totp_.has_generator() == false) {
        KVMPP_LOG_WARN("Session context created without a TOTP generator");
    }
}

SessionContext::~SessionContext() {
    if (close_on_destroy_) {
        const auto closed = registry_.close_all_connections();
        if (closed > 0) {
            KVMPP_LOG_DEBUG(std::format("Session context closed {} connection(s)", closed));
        }
    }
}

}  // namespace kvmpp
