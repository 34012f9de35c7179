// store.cpp
// lager-backed store with reentrancy checks

#include <draftcow/store.h>

#include <draftcow/log.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <exception>
#include <map>
#include <utility>
#include <vector>

namespace draftcow {

namespace {

// Forwards lager's reducer call to the user reducer; reducer failures are
// parked and rethrown once lager has returned
struct ReducerAdapter {
    const Store::Reducer* reducer;
    std::exception_ptr* failure;

    Value operator()(Value state, Value action) const
    {
        try {
            return (*reducer)(state, action);
        } catch (...) {
            *failure = std::current_exception();
            return state;
        }
    }
};

// Store type deduction helper
inline auto make_store_impl(Value initial, ReducerAdapter adapter)
{
    return lager::make_store<Value>(std::move(initial), lager::with_manual_event_loop{},
                                    lager::with_reducer(adapter));
}

using StoreType = decltype(make_store_impl(std::declval<Value>(), std::declval<ReducerAdapter>()));

} // namespace

// ============================================================
// Store::Impl
// ============================================================

struct Store::Impl {
    Reducer reducer;
    std::exception_ptr failure;
    std::unique_ptr<StoreType> store;

    bool dispatching = false;
    std::size_t next_observer_id = 0;
    std::map<std::size_t, Observer> observers;

    void check_not_dispatching(const char* message) const
    {
        if (dispatching) {
            detail::log_draft_event("Store", message);
            throw DispatchException(message);
        }
    }
};

Store::Store(Value initial_state, Reducer reducer)
    : impl_(std::make_shared<Impl>())
{
    if (!reducer) {
        throw std::invalid_argument("reducer");
    }
    impl_->reducer = std::move(reducer);
    impl_->store = std::make_unique<StoreType>(
        make_store_impl(std::move(initial_state), ReducerAdapter{&impl_->reducer, &impl_->failure}));

    dispatch(Value{std::string(init_action)});
}

Store::~Store() = default;

void Store::dispatch(Value action)
{
    impl_->check_not_dispatching("Dispatching actions from reducers is not allowed.");

    {
        struct DispatchingFlag {
            bool& flag;
            explicit DispatchingFlag(bool& f) : flag(f) { flag = true; }
            ~DispatchingFlag() { flag = false; }
        } guard{impl_->dispatching};

        impl_->failure = nullptr;
        impl_->store->dispatch(std::move(action));
    }

    if (impl_->failure) {
        std::rethrow_exception(std::exchange(impl_->failure, nullptr));
    }

    // Snapshot so observers may unsubscribe while being notified
    std::vector<Observer> snapshot;
    snapshot.reserve(impl_->observers.size());
    for (const auto& [id, observer] : impl_->observers) {
        snapshot.push_back(observer);
    }
    const Value current = impl_->store->get();
    for (const auto& observer : snapshot) {
        observer(current);
    }
}

Value Store::state() const
{
    impl_->check_not_dispatching("Cannot get the State while dispatching.");
    return impl_->store->get();
}

std::function<void()> Store::subscribe(Observer observer)
{
    if (!observer) {
        throw std::invalid_argument("observer");
    }
    impl_->check_not_dispatching("Adding subscriptions during Dispatching is not allowed.");

    const std::size_t id = impl_->next_observer_id++;
    impl_->observers.emplace(id, std::move(observer));

    return [weak = std::weak_ptr<Impl>{impl_}, id] {
        const auto impl = weak.lock();
        if (!impl) {
            return;
        }
        impl->check_not_dispatching("Removing subscriptions during Dispatching is not allowed.");
        impl->observers.erase(id);
    };
}

std::size_t Store::observer_count() const noexcept
{
    return impl_->observers.size();
}

} // namespace draftcow
