#pragma once

#include "surface.hpp"

#include <string>
#include <string_view>

namespace draw {

class SvgSurface final : public Surface {
  public:
    SvgSurface(double width, double height);

    void draw_polygon(std::span<const glm::dvec2> points) override;
    void draw_ellipse(glm::dvec2 center, double rx, double ry) override;
    void draw_path(const Path& path) override;

    // The complete document, header and closing tag included.
    std::string document() const;

    bool write(std::string_view file) const;

    std::size_t element_count() const noexcept {
        return elements;
    }

  private:
    std::string style() const;

    double width;
    double height;

    std::string body;
    std::size_t elements = 0;
};

} // namespace draw
