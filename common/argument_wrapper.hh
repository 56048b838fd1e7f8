#pragma once

namespace npuzzle {
// Marks an argument that the callee reads and mutates, e.g. a random number generator.
template <typename T>
class InOut {
   public:
    explicit InOut(T &obj) : obj_(obj) {}

    T &operator*() { return obj_; }
    T *operator->() { return &obj_; }

   private:
    T &obj_;
};

template <typename T>
InOut<T> make_in_out(T &obj) {
    return InOut(obj);
}

}  // namespace npuzzle
