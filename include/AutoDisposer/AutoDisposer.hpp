// AutoDisposer/AutoDisposer.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "AutoDisposer/Disposable.hpp"

// checkDisposed() 在对象已释放后抛出的异常。
class DisposedObjectError : public std::logic_error {
public:
    explicit DisposedObjectError(const std::string& what_arg)
        : std::logic_error(what_arg) {}
};

/**
 * @class AutoDisposer
 * @brief 跟踪一个对象的释放状态，并在释放时按注册的逆序执行清理动作。
 *
 * 用法：拥有者把 AutoDisposer 作为成员，在构造时通过 autoDispose()/
 * autoDisposeCustom() 登记需要清理的资源，在自己的 dispose() 中转调
 * AutoDisposer::dispose()，并在不允许释放后调用的操作开头调用 checkDisposed()。
 *
 * - dispose() 幂等：只有第一次调用会执行清理动作。
 * - 执行清理前先置位 disposed_，清理动作里再次调用 dispose() 会直接返回。
 * - 清理过程中新登记的动作会在同一次 dispose() 中被执行（后进先出）。
 * - 某个清理动作抛出异常时，异常原样传给调用者，剩余的动作不再执行。
 * - 释放之后再登记的动作不会报错，但永远不会被执行。
 *
 * 仅供单一所有者在单线程中使用，内部不加锁。
 */
class AutoDisposer : public Disposable {
public:
    using Disposer = std::function<void()>;

    AutoDisposer();
    explicit AutoDisposer(std::string owner_tag);
    ~AutoDisposer() override;

    // 已登记的动作可能持有本对象的引用，禁止拷贝和移动
    AutoDisposer(const AutoDisposer&) = delete;
    AutoDisposer& operator=(const AutoDisposer&) = delete;
    AutoDisposer(AutoDisposer&&) = delete;
    AutoDisposer& operator=(AutoDisposer&&) = delete;

    bool isDisposed() const noexcept { return disposed_; }

    // 已释放时抛出 DisposedObjectError
    void checkDisposed() const;

    // 调用者保证 disposable 存活到本对象被释放为止
    void autoDispose(Disposable& disposable);

    // 共享所有权，直到对应的清理动作执行完毕。空指针被忽略。
    void autoDispose(DisposablePtr disposable);

    // 空的 std::function 被忽略
    void autoDisposeCustom(Disposer disposer);

    void dispose() override;

    std::size_t pendingCount() const noexcept { return disposers_.size(); }
    const std::string& ownerTag() const noexcept { return owner_tag_; }

private:
    std::string describeOwner_() const;

private:
    bool disposed_ = false;
    std::vector<Disposer> disposers_;
    std::string owner_tag_;
};
