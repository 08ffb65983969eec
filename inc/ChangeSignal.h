/**
 * @file ChangeSignal.h
 * @author composite-endpoint-source contributors
 * @date 2026-10-19
 * @copyright Copyright (c) 2026 composite-endpoint-source contributors
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

/* Callback types */
typedef std::function<void(void)> change_cb_t;

/**
 * @brief
 *  ChangeSignal is a one-shot notification representing a single epoch of some data.
 *  It starts out armed, and transitions to fired exactly once. Anyone holding a fired
 *  signal knows that the data it was handed out alongside is stale.
 */
class ChangeSignal : public std::enable_shared_from_this<ChangeSignal>
{
public:
    /**
     * @brief A handle to a callback registered on a ChangeSignal
     */
    class Registration
    {
    public:
        Registration();
        Registration(std::weak_ptr<ChangeSignal> signal, uint64_t id);

        /**
         * @brief Whether the callback is still registered and waiting on the signal
         */
        bool IsActive() const;

        /**
         * @brief
         *  Removes the callback from the signal if it has not fired yet.
         *  If this races with Fire(), the callback may still be invoked.
         */
        void Unsubscribe();

    private:
        std::weak_ptr<ChangeSignal> signal;
        uint64_t id;
    };

    /* Constructor/Destructor */
    /**
     * @param canFire false to create a signal that ignores Fire() and never changes
     */
    explicit ChangeSignal(bool canFire = true);

    /* Static methods */
    /**
     * @brief Returns a shared signal that never fires, for data that never changes
     */
    static std::shared_ptr<ChangeSignal> Never();

    /* Public methods */
    /**
     * @brief
     *  Registers a callback to run when this signal fires.
     *  If the signal has already fired, the callback is invoked on the calling thread
     *  before this method returns, and the returned registration is inactive.
     * @param callback callback to run once
     * @return Registration handle that can be used to unsubscribe
     */
    Registration Subscribe(change_cb_t callback);

    /**
     * @brief
     *  Registers a callback only if this signal has not fired yet.
     *  The callback is never invoked synchronously by this call.
     * @param callback callback to run once
     * @return std::optional<Registration> registration, or empty if already fired
     */
    std::optional<Registration> SubscribeIfArmed(change_cb_t callback);

    /**
     * @brief
     *  Transitions this signal to fired and runs all registered callbacks on the
     *  calling thread. Calling this more than once is a no-op.
     *  If any callback throws, the remaining callbacks still run and the first
     *  exception is rethrown afterwards.
     * @return bool true if this call fired the signal
     */
    bool Fire();

    bool HasFired();

    /**
     * @brief Blocks until this signal has fired
     */
    void Wait();

    /**
     * @brief Blocks until this signal has fired or the given duration elapses
     * @return bool true if the signal has fired
     */
    template <class Rep, class Period>
    bool WaitFor(const std::chrono::duration<Rep, Period>& relTime)
    {
        std::unique_lock<std::mutex> lock(mutex);
        return firedCv.wait_for(lock, relTime, [this] { return fired; });
    }

    /**
     * @brief Number of callbacks currently waiting for this signal to fire
     */
    size_t GetSubscriberCount();

private:
    /* Private members */
    const bool canFire;
    std::mutex mutex;
    std::condition_variable firedCv;
    bool fired = false;
    uint64_t nextRegistrationId = 1;
    // Ordered by registration id, which is also the order callbacks are invoked in
    std::map<uint64_t, change_cb_t> callbacks;

    /* Private methods */
    void unsubscribe(uint64_t id);
};
