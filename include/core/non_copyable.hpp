#ifndef SLIDE_VOICE_NON_COPYABLE_HPP
#define SLIDE_VOICE_NON_COPYABLE_HPP

namespace core {
    class NonCopyable {
    protected:
        NonCopyable() = default;
        ~NonCopyable() = default;

    public:
        NonCopyable(const NonCopyable&) = delete;
        NonCopyable& operator=(const NonCopyable&) = delete;
    };
}

#endif
