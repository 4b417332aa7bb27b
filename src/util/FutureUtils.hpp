/**
 * @file FutureUtils.hpp
 * @brief Helpers for QFuture/QPromise based asynchronous results.
 */

#pragma once
#include <QFuture>
#include <QPromise>
#include <memory>
#include <utility>

namespace mc {

template <typename T>
using SharedPromise = std::shared_ptr<QPromise<T>>;

// Promise already in the started state; shared so lambdas can capture it
template <typename T>
SharedPromise<T> makeSharedPromise() {
    auto promise = std::make_shared<QPromise<T>>();
    promise->start();
    return promise;
}

template <typename T>
void settle(const SharedPromise<T>& promise, T value) {
    promise->addResult(std::move(value));
    promise->finish();
}

template <typename T>
QFuture<T> readyFuture(T value) {
    QPromise<T> promise;
    promise.start();
    promise.addResult(std::move(value));
    promise.finish();
    return promise.future();
}

} // namespace mc
