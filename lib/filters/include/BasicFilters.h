#pragma once
#include <type_traits>

// First order low-pass: y += (x - y) * alpha.
// The first sample seeds the output so startup carries no lag from zero.
template <typename T>
class ExponentialFilter
{
public:
    ExponentialFilter() { reset(); }
    explicit ExponentialFilter(float alpha) : m_alpha(alpha) { reset(); }

    void setAlpha(float alpha) { m_alpha = alpha; }
    float getAlpha() const { return m_alpha; }

    const T &apply(const T &x)
    {
        if (!m_seeded)
        {
            m_y = x;
            m_seeded = true;
            return m_y;
        }
        m_y = m_y + (x - m_y) * m_alpha;
        return m_y;
    }

    const T &value() const { return m_y; }
    bool isSeeded() const { return m_seeded; }

    void reset()
    {
        m_seeded = false;
        setZero(m_y);
    }

private:
    float m_alpha = 1.0f;
    bool m_seeded = false;
    T m_y;

    void setZero(T &v)
    {
        if constexpr (std::is_class<T>::value)
            v.setZero();
        else
            v = 0;
    }
};
