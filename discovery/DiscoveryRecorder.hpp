#pragma once

#include "../common/DiscoveryTypes.hpp"

namespace whos_home::discovery
{
    // Optional persistence collaborator, fed once per host found online during a sweep.
    class DiscoveryRecorder
    {
    public:
        virtual ~DiscoveryRecorder() = default;
        virtual void RecordAttempt(const common::DiscoveryAttempt &attempt) = 0;
    };
}
