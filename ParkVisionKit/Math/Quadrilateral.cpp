//    *************************** ParkVisionKit ****************************
//    Copyright (C) 2026  The ParkVisionKit Authors
//
//    This program is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with this program.  If not, see <https://www.gnu.org/licenses/>.
// 	  **********************************************************************

#include "Quadrilateral.hpp"

#include <algorithm>
#include <cstdint>

#include "Directives.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    bool Line::is_horizontal() const
    {
        return start.y == end.y;
    }

//---------------------------------------------------------------------------------------------------------------------

    Quadrilateral Quadrilateral::Canonical(const int size)
    {
        PVK_ASSERT(size > 0);

        return Quadrilateral(
            {0, size},
            {size, size},
            {size, 0},
            {0, 0}
        );
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> Quadrilateral::FromVertices(const std::vector<cv::Point>& vertices, Quadrilateral& quad)
    {
        if(vertices.size() != 4)
        {
            return Error{
                ErrorKind::InvalidArgument,
                cv::format("A quadrilateral needs exactly 4 vertices, got %zu", vertices.size())
            };
        }

        quad = Quadrilateral(vertices[0], vertices[1], vertices[2], vertices[3]);
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    Quadrilateral::Quadrilateral()
        : Quadrilateral({0, 0}, {0, 0}, {0, 0}, {0, 0})
    {}

//---------------------------------------------------------------------------------------------------------------------

	Quadrilateral::Quadrilateral(
        const cv::Point& top_left,
        const cv::Point& top_right,
        const cv::Point& bottom_right,
        const cv::Point& bottom_left
    )
        : m_TopLeft(top_left),
          m_TopRight(top_right),
          m_BottomRight(bottom_right),
          m_BottomLeft(bottom_left)
	{}

//---------------------------------------------------------------------------------------------------------------------

    const cv::Point& Quadrilateral::top_left() const
    {
        return m_TopLeft;
    }

//---------------------------------------------------------------------------------------------------------------------

    const cv::Point& Quadrilateral::top_right() const
    {
        return m_TopRight;
    }

//---------------------------------------------------------------------------------------------------------------------

    const cv::Point& Quadrilateral::bottom_right() const
    {
        return m_BottomRight;
    }

//---------------------------------------------------------------------------------------------------------------------

    const cv::Point& Quadrilateral::bottom_left() const
    {
        return m_BottomLeft;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::array<cv::Point, 4> Quadrilateral::vertices() const
    {
        return {m_TopLeft, m_TopRight, m_BottomRight, m_BottomLeft};
    }

//---------------------------------------------------------------------------------------------------------------------

    std::array<Line, 4> Quadrilateral::edges() const
    {
        // NOTE: Must follow the closed tl -> tr -> br -> bl -> tl loop
        return {
            Line{m_TopLeft, m_TopRight},
            Line{m_TopRight, m_BottomRight},
            Line{m_BottomRight, m_BottomLeft},
            Line{m_BottomLeft, m_TopLeft}
        };
    }

//---------------------------------------------------------------------------------------------------------------------

    cv::Rect Quadrilateral::bounding_rect() const
    {
        const auto corners = vertices();

        const auto [min_x, max_x] = std::minmax({corners[0].x, corners[1].x, corners[2].x, corners[3].x});
        const auto [min_y, max_y] = std::minmax({corners[0].y, corners[1].y, corners[2].y, corners[3].y});

        // The corners themselves are pixels, so the extremes are included.
        return cv::Rect(min_x, min_y, max_x - min_x + 1, max_y - min_y + 1);
    }

//---------------------------------------------------------------------------------------------------------------------

    cv::Point2d Quadrilateral::centroid() const
    {
        cv::Point2d sum(0, 0);
        for(const auto& corner : vertices())
            sum += cv::Point2d(corner);

        return sum / 4.0;
    }

//---------------------------------------------------------------------------------------------------------------------

	bool Quadrilateral::encloses(const cv::Point& point) const
	{
        // Even-odd rule using a horizontal ray cast towards +x. Crossings are evaluated
        // in exact integer arithmetic, edge y-spans are half-open and a point lying
        // exactly on a slanted or vertical edge never counts that edge as crossed.
        bool inside = false;
        for(const auto& [start, end] : edges())
        {
            // Points on a horizontal edge are always enclosed.
            if(start.y == point.y && end.y == point.y
               && point.x >= std::min(start.x, end.x) && point.x <= std::max(start.x, end.x))
            {
                return true;
            }

            if((start.y <= point.y && point.y < end.y) || (end.y <= point.y && point.y < start.y))
            {
                // Equivalent to point.x < start.x + (end.x - start.x) * (point.y - start.y) / (end.y - start.y)
                const int64_t dy = end.y - start.y;
                const int64_t lhs = static_cast<int64_t>(point.x - start.x) * dy;
                const int64_t rhs = static_cast<int64_t>(end.x - start.x) * (point.y - start.y);

                if(dy > 0 ? lhs < rhs : lhs > rhs)
                    inside = !inside;
            }
        }
        return inside;
	}

//---------------------------------------------------------------------------------------------------------------------

    std::vector<cv::Point> Quadrilateral::enclosed(const std::vector<cv::Point>& points) const
    {
        std::vector<cv::Point> enclosed_points;
        enclosed_points.reserve(points.size());

        for(const auto& point : points)
        {
            if(encloses(point))
            {
                PVK_LOG_DEBUG("(%d, %d) is inside the region", point.x, point.y);
                enclosed_points.push_back(point);
            }
            else PVK_LOG_DEBUG("(%d, %d) is outside the region, removing it", point.x, point.y);
        }

        return enclosed_points;
    }

//---------------------------------------------------------------------------------------------------------------------

    bool Quadrilateral::operator==(const Quadrilateral& other) const
    {
        return m_TopLeft == other.m_TopLeft
            && m_TopRight == other.m_TopRight
            && m_BottomRight == other.m_BottomRight
            && m_BottomLeft == other.m_BottomLeft;
    }

//---------------------------------------------------------------------------------------------------------------------

    bool Quadrilateral::operator!=(const Quadrilateral& other) const
    {
        return !(*this == other);
    }

//---------------------------------------------------------------------------------------------------------------------

}
