/**
 * @file IAttestationPrompt.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief User decision points of the attestation flow
 * @version 0.1
 * @date 2026-03-10
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <functional>

namespace tap
{
    /**
     * @brief Presents attestation outcomes that need the user's consent
     *
     * Exactly one of the callbacks passed to a prompt must be invoked, once.
     */
    class IAttestationPrompt
    {
    public:
        using Action = std::function<void()>;

        virtual ~IAttestationPrompt() = default;

        /**
         * @brief Card failed attestation but may still be used
         *
         * @param isDevelopmentCard Card runs SDK firmware
         */
        virtual void attestationDidFail(bool isDevelopmentCard, Action onContinue, Action onCancel) = 0;

        /**
         * @brief Card verified offline only, online check did not confirm it
         */
        virtual void attestationCompletedOffline(Action onContinue, Action onCancel, Action onRetry) = 0;

        /**
         * @brief Card verified but showed suspicious activity
         */
        virtual void attestationCompletedWithWarnings(Action onContinue) = 0;
    };

} // namespace tap
