// AutoDisposer.cpp
#include "AutoDisposer/AutoDisposer.hpp"

#include <iostream>
#include <sstream>
#include <utility>

AutoDisposer::AutoDisposer()
    : owner_tag_("AutoDisposer") {}

AutoDisposer::AutoDisposer(std::string owner_tag)
    : owner_tag_(std::move(owner_tag)) {}

// 析构不会触发 dispose()，未执行的动作随 vector 一起销毁
AutoDisposer::~AutoDisposer() = default;

std::string AutoDisposer::describeOwner_() const {
    std::ostringstream oss;
    oss << owner_tag_ << "@" << static_cast<const void*>(this);
    return oss.str();
}

void AutoDisposer::checkDisposed() const {
    if (disposed_) {
        throw DisposedObjectError("Object [" + describeOwner_() + "] has been disposed!");
    }
}

void AutoDisposer::autoDispose(Disposable& disposable) {
    Disposable* target = &disposable;
    disposers_.emplace_back([target]() { target->dispose(); });
}

void AutoDisposer::autoDispose(DisposablePtr disposable) {
    if (!disposable) {
        return;
    }
    disposers_.emplace_back([holder = std::move(disposable)]() { holder->dispose(); });
}

void AutoDisposer::autoDisposeCustom(Disposer disposer) {
    if (!disposer) {
        return;
    }
    disposers_.push_back(std::move(disposer));
}

void AutoDisposer::dispose() {
    if (disposed_) {
        return;
    }

    // 必须先置位：清理动作中重入的 dispose() 会在上面直接返回
    disposed_ = true;

    while (!disposers_.empty()) {
        // 先取出再执行。动作执行期间可能向 disposers_ 追加新元素，
        // 所以不能持有指向 vector 内部的引用。
        Disposer disposer = std::move(disposers_.back());
        disposers_.pop_back();

        try {
            disposer();
        } catch (...) {
            std::cerr << "[AutoDisposer::dispose] WARNING: cleanup action threw, "
                      << disposers_.size() << " pending action(s) abandoned ("
                      << describeOwner_() << ")" << std::endl;
            disposers_.clear();
            throw;
        }
    }
}
