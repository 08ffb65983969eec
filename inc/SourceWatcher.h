/**
 * @file SourceWatcher.h
 * @author composite-endpoint-source contributors
 * @date 2026-10-19
 * @copyright Copyright (c) 2026 composite-endpoint-source contributors
 */

#pragma once

#include "ChangeSignal.h"

#include <functional>
#include <memory>
#include <mutex>

/* Callback types */
typedef std::function<std::shared_ptr<ChangeSignal>(void)> signal_producer_t;

/**
 * @brief
 *  SourceWatcher keeps a continuous watch on a source whose ChangeSignal is replaced
 *  every time it changes. Each time the current signal fires, the watcher grabs the
 *  signal the source hands out next, invokes its callback, then subscribes to it.
 *  Must be owned by a std::shared_ptr.
 */
class SourceWatcher : public std::enable_shared_from_this<SourceWatcher>
{
public:
    /* Constructor/Destructor */
    /**
     * @param signalProducer returns the source's current change signal
     * @param onChanged callback to fire each time the source changes
     */
    SourceWatcher(signal_producer_t signalProducer, change_cb_t onChanged);

    /* Public methods */
    /**
     * @brief Starts watching the source
     * @param initialSignal
     *  signal to start watching from, if the caller already fetched one. If it has
     *  already fired, onChanged is invoked right away on the calling thread.
     */
    void Start(std::shared_ptr<ChangeSignal> initialSignal = nullptr);

    /**
     * @brief Stops watching. Changes that fire after this returns are ignored.
     */
    void Stop();

    bool IsWatching();

private:
    /* Private members */
    const signal_producer_t signalProducer;
    const change_cb_t onChanged;
    std::mutex mutex;
    bool isStarted = false;
    bool isStopped = false;
    ChangeSignal::Registration registration;

    /* Private methods */
    bool trySubscribe(const std::shared_ptr<ChangeSignal>& signal);
    void signalFired(std::shared_ptr<ChangeSignal> firedSignal);
};
