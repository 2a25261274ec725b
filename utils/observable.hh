/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/util/noncopyable_function.hh>
#include <vector>
#include <algorithm>
#include <utility>

namespace utils {

template <typename... Args>
class observer;

// An observable notifies a dynamic set of observers each time it is called.
// Observers unsubscribe by being destroyed. Destroying the observable
// detaches whatever observers remain.
template <typename... Args>
class observable {
public:
    using observer_type = observer<Args...>;
private:
    std::vector<observer_type*> _observers;
public:
    observable() = default;
    observable(const observable&) = delete;
    observable(observable&& o) noexcept : _observers(std::exchange(o._observers, {})) {
        for (auto* ob : _observers) {
            ob->_observable = this;
        }
    }
    ~observable() {
        for (auto* ob : _observers) {
            ob->_observable = nullptr;
        }
    }

    observer_type observe(seastar::noncopyable_function<void (Args...)> callback) {
        return observer_type(this, std::move(callback));
    }

    void operator()(Args... args) const {
        // Copy, so an observer may unsubscribe from within its callback.
        auto observers = _observers;
        for (auto* ob : observers) {
            ob->_callback(args...);
        }
    }
private:
    void attach(observer_type* ob) {
        _observers.push_back(ob);
    }
    void detach(observer_type* ob) noexcept {
        _observers.erase(std::remove(_observers.begin(), _observers.end(), ob), _observers.end());
    }
    void replace(observer_type* from, observer_type* to) noexcept {
        std::replace(_observers.begin(), _observers.end(), from, to);
    }

    friend class observer<Args...>;
};

template <typename... Args>
class observer {
    observable<Args...>* _observable;
    seastar::noncopyable_function<void (Args...)> _callback;
private:
    observer(observable<Args...>* o, seastar::noncopyable_function<void (Args...)> callback)
            : _observable(o), _callback(std::move(callback)) {
        _observable->attach(this);
    }
public:
    observer(observer&& o) noexcept
            : _observable(std::exchange(o._observable, nullptr))
            , _callback(std::move(o._callback)) {
        if (_observable) {
            _observable->replace(&o, this);
        }
    }
    observer& operator=(observer&& o) noexcept {
        if (this != &o) {
            disconnect();
            _observable = std::exchange(o._observable, nullptr);
            _callback = std::move(o._callback);
            if (_observable) {
                _observable->replace(&o, this);
            }
        }
        return *this;
    }
    ~observer() {
        disconnect();
    }

    void disconnect() noexcept {
        if (_observable) {
            _observable->detach(this);
            _observable = nullptr;
        }
    }

    friend class observable<Args...>;
};

}
