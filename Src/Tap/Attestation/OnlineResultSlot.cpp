/**
 * @file OnlineResultSlot.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Online result slot implementation
 * @version 0.1
 * @date 2026-03-10
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Attestation/OnlineResultSlot.h"
#include "Utils/Logging.h"

using namespace tap;

OnlineResultSlot::OnlineResultSlot()
    : state(std::make_shared<State>())
{
}

OnlineResultSlot::~OnlineResultSlot()
{
    reset();
}

OnlineResultSlot::Token OnlineResultSlot::arm()
{
    std::scoped_lock guard{state->lock};
    ++state->generation;
    state->result.reset();
    state->subscriber = nullptr;
    return state->generation;
}

bool OnlineResultSlot::publishTo(State& slotState, Token token, const VerificationResult& result)
{
    Subscriber subscriber;
    {
        std::scoped_lock guard{slotState.lock};
        if (token != slotState.generation)
        {
            LOG_DEBUG("Dropping online result for stale token %u (current %u)",
                      static_cast<unsigned>(token), static_cast<unsigned>(slotState.generation));
            return false;
        }

        if (slotState.result.has_value())
        {
            return false;
        }

        if (!slotState.subscriber)
        {
            slotState.result = result;
            return true;
        }

        subscriber = std::move(slotState.subscriber);
        slotState.subscriber = nullptr;
        slotState.result = result;
    }

    // Outside the lock, the subscriber may arm() again
    subscriber(result);
    return true;
}

bool OnlineResultSlot::publish(Token token, const VerificationResult& result)
{
    return publishTo(*state, token, result);
}

OnlineResultSlot::Publisher OnlineResultSlot::publisher(Token token) const
{
    std::weak_ptr<State> weakState = state;
    return [weakState, token](const VerificationResult& result) {
        std::shared_ptr<State> slotState = weakState.lock();
        if (!slotState)
        {
            LOG_DEBUG("Online result arrived after its slot was destroyed");
            return;
        }
        publishTo(*slotState, token, result);
    };
}

void OnlineResultSlot::subscribe(Subscriber subscriber)
{
    etl::optional<VerificationResult> ready;
    {
        std::scoped_lock guard{state->lock};
        if (!state->result.has_value())
        {
            state->subscriber = std::move(subscriber);
            return;
        }
        ready = state->result;
    }

    subscriber(ready.value());
}

void OnlineResultSlot::reset()
{
    std::scoped_lock guard{state->lock};
    ++state->generation;
    state->result.reset();
    state->subscriber = nullptr;
}

bool OnlineResultSlot::hasResult() const
{
    std::scoped_lock guard{state->lock};
    return state->result.has_value();
}

OnlineResultSlot::Token OnlineResultSlot::currentToken() const
{
    std::scoped_lock guard{state->lock};
    return state->generation;
}
