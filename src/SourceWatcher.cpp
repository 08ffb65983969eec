/**
 * @file SourceWatcher.cpp
 * @author composite-endpoint-source contributors
 * @date 2026-10-19
 * @copyright Copyright (c) 2026 composite-endpoint-source contributors
 */

#include "SourceWatcher.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>

#pragma region Constructor/Destructor
SourceWatcher::SourceWatcher(signal_producer_t signalProducer, change_cb_t onChanged) :
    signalProducer(std::move(signalProducer)),
    onChanged(std::move(onChanged))
{ }
#pragma endregion

#pragma region Public methods
void SourceWatcher::Start(std::shared_ptr<ChangeSignal> initialSignal)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (isStarted)
        {
            throw std::runtime_error("SourceWatcher has already been started");
        }
        isStarted = true;
    }

    std::shared_ptr<ChangeSignal> signal = initialSignal ? initialSignal : signalProducer();
    if (!trySubscribe(signal))
    {
        // The source changed before we got here
        signalFired(signal);
    }
}

void SourceWatcher::Stop()
{
    ChangeSignal::Registration oldRegistration;
    {
        std::lock_guard<std::mutex> lock(mutex);
        isStopped = true;
        oldRegistration = registration;
        registration = ChangeSignal::Registration();
    }
    oldRegistration.Unsubscribe();
}

bool SourceWatcher::IsWatching()
{
    std::lock_guard<std::mutex> lock(mutex);
    return (isStarted && !isStopped);
}
#pragma endregion

#pragma region Private methods
bool SourceWatcher::trySubscribe(const std::shared_ptr<ChangeSignal>& signal)
{
    // Weak references on both sides - the signal shouldn't keep us alive, and we
    // shouldn't create a cycle through the signal's own callback list.
    std::weak_ptr<SourceWatcher> weakThis = weak_from_this();
    std::weak_ptr<ChangeSignal> weakSignal(signal);
    std::optional<ChangeSignal::Registration> newRegistration = signal->SubscribeIfArmed(
        [weakThis, weakSignal]()
        {
            if (auto strongThis = weakThis.lock())
            {
                strongThis->signalFired(weakSignal.lock());
            }
        });
    if (!newRegistration)
    {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (isStopped)
    {
        newRegistration->Unsubscribe();
        return true;
    }
    registration = newRegistration.value();
    return true;
}

void SourceWatcher::signalFired(std::shared_ptr<ChangeSignal> firedSignal)
{
    // We always resubscribe, even if the callback blows up, so there's never a gap in
    // the watch. The first error is handed back to whoever fired the signal.
    std::exception_ptr firstError;
    while (IsWatching())
    {
        // Fetch the next signal before the callback reads the source, so a change that
        // lands while the callback runs leaves us holding an already-fired signal.
        std::shared_ptr<ChangeSignal> nextSignal = signalProducer();
        try
        {
            onChanged();
        }
        catch (...)
        {
            if (firstError)
            {
                spdlog::warn("SourceWatcher: Change callback failed again, dropping its error");
            }
            else
            {
                firstError = std::current_exception();
            }
        }

        if (trySubscribe(nextSignal))
        {
            break;
        }

        if (nextSignal == firedSignal)
        {
            spdlog::warn(
                "SourceWatcher: Source handed out a change signal that has already fired "
                "without rotating it, no longer watching for changes");
            std::lock_guard<std::mutex> lock(mutex);
            isStopped = true;
            break;
        }

        // The source changed again before we could subscribe, go around again
        spdlog::trace("SourceWatcher: Source changed again before resubscribing");
        firedSignal = nextSignal;
    }

    if (firstError)
    {
        std::rethrow_exception(firstError);
    }
}
#pragma endregion
