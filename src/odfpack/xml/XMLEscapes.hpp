#pragma once

#include <cstddef>

namespace odfpack {
namespace xml {

// XML 转义常量：集中提供实体字面量
struct XMLEscapes {
    inline static constexpr char AMP[]  = "&amp;";   // &  → &amp;
    inline static constexpr char LT[]   = "&lt;";    // <  → &lt;
    inline static constexpr char GT[]   = "&gt;";    // >  → &gt;
    inline static constexpr char QUOT[] = "&quot;";  // " → &quot;
    inline static constexpr char NL[]   = "&#xA;";   // \n（属性上下文）
    inline static constexpr char TAB[]  = "&#x9;";   // \t（属性上下文）
};

} // namespace xml
} // namespace odfpack
