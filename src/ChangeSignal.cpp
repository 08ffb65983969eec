/**
 * @file ChangeSignal.cpp
 * @author composite-endpoint-source contributors
 * @date 2026-10-19
 * @copyright Copyright (c) 2026 composite-endpoint-source contributors
 */

#include "ChangeSignal.h"

#include <spdlog/spdlog.h>

#include <exception>

#pragma region Registration
ChangeSignal::Registration::Registration() :
    id(0)
{ }

ChangeSignal::Registration::Registration(std::weak_ptr<ChangeSignal> signal, uint64_t id) :
    signal(signal),
    id(id)
{ }

bool ChangeSignal::Registration::IsActive() const
{
    if (auto strongSignal = signal.lock())
    {
        std::lock_guard<std::mutex> lock(strongSignal->mutex);
        return (strongSignal->callbacks.count(id) > 0);
    }
    return false;
}

void ChangeSignal::Registration::Unsubscribe()
{
    if (auto strongSignal = signal.lock())
    {
        strongSignal->unsubscribe(id);
    }
    signal.reset();
}
#pragma endregion

#pragma region Constructor/Destructor
ChangeSignal::ChangeSignal(bool canFire) :
    canFire(canFire)
{ }
#pragma endregion

#pragma region Static methods
std::shared_ptr<ChangeSignal> ChangeSignal::Never()
{
    static const std::shared_ptr<ChangeSignal> neverSignal = std::make_shared<ChangeSignal>(false);
    return neverSignal;
}
#pragma endregion

#pragma region Public methods
ChangeSignal::Registration ChangeSignal::Subscribe(change_cb_t callback)
{
    if (auto registration = SubscribeIfArmed(callback))
    {
        return registration.value();
    }

    // We've already fired - the caller is late to the party, so run it right away.
    callback();
    return Registration();
}

std::optional<ChangeSignal::Registration> ChangeSignal::SubscribeIfArmed(change_cb_t callback)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (fired)
    {
        return std::nullopt;
    }
    if (!canFire)
    {
        // Nothing will ever call this, so don't bother holding on to it
        return Registration();
    }
    uint64_t id = nextRegistrationId++;
    callbacks.emplace(id, std::move(callback));
    return Registration(weak_from_this(), id);
}

bool ChangeSignal::Fire()
{
    std::map<uint64_t, change_cb_t> pendingCallbacks;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (fired || !canFire)
        {
            return false;
        }
        fired = true;
        pendingCallbacks.swap(callbacks);
    }
    firedCv.notify_all();

    // Callbacks are run without holding our lock, so they're free to subscribe to
    // (or fire) whatever they like.
    std::exception_ptr firstError;
    for (auto& [id, callback] : pendingCallbacks)
    {
        try
        {
            callback();
        }
        catch (...)
        {
            if (firstError)
            {
                spdlog::warn(
                    "ChangeSignal: Subscriber {} also failed while firing, dropping its error",
                    id);
            }
            else
            {
                firstError = std::current_exception();
            }
        }
    }

    if (firstError)
    {
        std::rethrow_exception(firstError);
    }
    return true;
}

bool ChangeSignal::HasFired()
{
    std::lock_guard<std::mutex> lock(mutex);
    return fired;
}

void ChangeSignal::Wait()
{
    std::unique_lock<std::mutex> lock(mutex);
    firedCv.wait(lock, [this] { return fired; });
}

size_t ChangeSignal::GetSubscriberCount()
{
    std::lock_guard<std::mutex> lock(mutex);
    return callbacks.size();
}
#pragma endregion

#pragma region Private methods
void ChangeSignal::unsubscribe(uint64_t id)
{
    std::lock_guard<std::mutex> lock(mutex);
    callbacks.erase(id);
}
#pragma endregion
