// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The RevSplit developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef REVSPLIT_SYNC_H
#define REVSPLIT_SYNC_H

#include "threadsafety.h"

#include <mutex>
#include <type_traits>

////////////////////////////////////////////////
//                                            //
// THE SIMPLE DEFINITION, EXCLUDING DEBUG CODE //
//                                            //
////////////////////////////////////////////////

/*
RecursiveMutex mutex;
    std::recursive_mutex mutex;

LOCK(mutex);
    std::unique_lock<std::recursive_mutex> criticalblock(mutex);

WITH_LOCK(mutex, return value);
    [&] { LOCK(mutex); return value; }()
 */

/**
 * Template mixin that adds -Wthread-safety locking annotations to a
 * subset of the mutex API.
 */
template <typename PARENT>
class LOCKABLE AnnotatedMixin : public PARENT
{
public:
    ~AnnotatedMixin() {}

    void lock() EXCLUSIVE_LOCK_FUNCTION()
    {
        PARENT::lock();
    }

    void unlock() UNLOCK_FUNCTION()
    {
        PARENT::unlock();
    }

    bool try_lock() EXCLUSIVE_TRYLOCK_FUNCTION(true)
    {
        return PARENT::try_lock();
    }

    using UniqueLock = std::unique_lock<PARENT>;
};

/**
 * Wrapped mutex: supports recursive locking, but no waiting
 */
typedef AnnotatedMixin<std::recursive_mutex> RecursiveMutex;

/** Wrapped mutex: supports waiting but not recursive locking */
typedef AnnotatedMixin<std::mutex> Mutex;

/** Wrapper around std::unique_lock style lock for Mutex. */
template <typename MutexType>
class SCOPED_LOCKABLE UniqueLock : public MutexType::UniqueLock
{
private:
    typedef typename MutexType::UniqueLock Base;

public:
    explicit UniqueLock(MutexType& mutexIn) EXCLUSIVE_LOCK_FUNCTION(mutexIn) : Base(mutexIn) {}
    ~UniqueLock() UNLOCK_FUNCTION() {}
};

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) UniqueLock<typename std::remove_reference<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs)

//! Run code while locking a mutex.
//!
//! Examples:
//!
//!   WITH_LOCK(cs, shared_val = shared_val + 1);
//!
//!   int val = WITH_LOCK(cs, return shared_val);
#define WITH_LOCK(cs, code) [&] { LOCK(cs); code; }()

#endif // REVSPLIT_SYNC_H
