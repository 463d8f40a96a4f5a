// AutoDisposer/Disposable.hpp
#pragma once

#include <functional>
#include <memory>
#include <utility>

/**
 * @class Disposable
 * @brief 可被释放（dispose）的对象的接口。
 *
 * 只有一个操作：dispose()。具体语义（是否幂等等）由实现类决定。
 */
class Disposable {
public:
    virtual ~Disposable() = default;

    virtual void dispose() = 0;
};

using DisposablePtr = std::shared_ptr<Disposable>;


// 把任意无参可调用对象包装成 Disposable。
// 每次 dispose() 都会调用一次被包装的函数，本身不记录状态。
class FunctionDisposable : public Disposable {
public:
    FunctionDisposable() = default;

    explicit FunctionDisposable(std::function<void()> fn)
        : fn_(std::move(fn)) {}

    void dispose() override {
        if (fn_) {
            fn_();
        }
    }

private:
    std::function<void()> fn_;
};


inline DisposablePtr makeDisposable(std::function<void()> fn) {
    return std::make_shared<FunctionDisposable>(std::move(fn));
}
