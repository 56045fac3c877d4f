/**
 * @file OnlineResultSlot.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Single pending online verification result
 * @version 0.1
 * @date 2026-03-10
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <etl/optional.h>
#include "IOnlineCardVerifier.h"

namespace tap
{
    /**
     * @brief Holds at most one pending result and one subscriber
     *
     * Every arm() starts a new generation and returns its token. A result
     * published with an older token is dropped, so a late answer to a
     * superseded request never reaches the current subscriber. The
     * subscriber fires once: immediately if the result is already there,
     * otherwise on publish.
     *
     * Publishers returned by publisher() only hold a weak reference and may
     * safely outlive the slot.
     */
    class OnlineResultSlot
    {
    public:
        using Token = uint32_t;
        using Subscriber = std::function<void(const VerificationResult&)>;
        using Publisher = std::function<void(const VerificationResult&)>;

        OnlineResultSlot();
        ~OnlineResultSlot();

        OnlineResultSlot(const OnlineResultSlot&) = delete;
        OnlineResultSlot& operator=(const OnlineResultSlot&) = delete;

        /**
         * @brief Start a new generation, dropping any pending result and subscriber
         */
        Token arm();

        /**
         * @brief Deliver a result for a generation
         *
         * @return true if the token is current and the result was accepted
         */
        bool publish(Token token, const VerificationResult& result);

        /**
         * @brief Callback form of publish() bound to a token
         */
        Publisher publisher(Token token) const;

        void subscribe(Subscriber subscriber);

        /**
         * @brief Drop pending state and invalidate every issued token
         */
        void reset();

        bool hasResult() const;

        Token currentToken() const;

    private:
        struct State
        {
            std::mutex lock;
            Token generation = 0;
            etl::optional<VerificationResult> result;
            Subscriber subscriber;
        };

        static bool publishTo(State& state, Token token, const VerificationResult& result);

        std::shared_ptr<State> state;
    };

} // namespace tap
