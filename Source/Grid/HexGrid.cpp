#include "HexGrid.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace hexglow {

// Rows and columns spanned by a grid of this radius, margin included
static void spanFor(double surfaceWidth, double surfaceHeight, double hexRadius,
                    double& startRow, double& endRow, double& startCol, double& endCol)
{
    const double margin = 2.0;
    double rowPitch    = 1.5 * hexRadius;
    double columnPitch = std::sqrt(3.0) * hexRadius;
    startRow = -std::ceil(hexRadius / rowPitch) - margin;
    endRow   =  std::ceil((surfaceHeight + hexRadius) / rowPitch) + margin;
    startCol = -std::ceil(hexRadius / columnPitch) - margin;
    endCol   =  std::ceil((surfaceWidth + hexRadius) / columnPitch) + margin;
}

double HexGrid::cellCountFor(double surfaceWidth, double surfaceHeight, double hexRadius)
{
    double startRow, endRow, startCol, endCol;
    spanFor(surfaceWidth, surfaceHeight, hexRadius, startRow, endRow, startCol, endCol);
    return (endRow - startRow) * (endCol - startCol);
}

double HexGrid::effectiveRadius(double surfaceWidth, double surfaceHeight, double hexRadius)
{
    if (cellCountFor(surfaceWidth, surfaceHeight, hexRadius) <= (double)MaxCells)
        return hexRadius;

    // Area bound: each cell covers 1.5 * sqrt(3) * r^2 of the surface
    double r = std::max(hexRadius, std::sqrt(surfaceWidth * surfaceHeight
                                             / (1.5 * std::sqrt(3.0) * (double)MaxCells)));
    while (cellCountFor(surfaceWidth, surfaceHeight, r) > (double)MaxCells)
        r *= 1.01;
    return r;
}

HexGrid HexGrid::build(double surfaceWidth, double surfaceHeight, double hexRadius)
{
    HexGrid grid;

    if (!std::isfinite(surfaceWidth) || !std::isfinite(surfaceHeight) || !std::isfinite(hexRadius))
        return grid;
    if (surfaceWidth <= 0.0 || surfaceHeight <= 0.0 || hexRadius <= 0.0)
        return grid;

    double radius = effectiveRadius(surfaceWidth, surfaceHeight, hexRadius);
    if (!std::isfinite(radius))
        return grid;
    if (radius != hexRadius) {
        DBG("[grid] Radius " + juce::String(hexRadius, 2) + " too fine for "
            + juce::String(surfaceWidth, 0) + "x" + juce::String(surfaceHeight, 0)
            + ", using " + juce::String(radius, 2));
    }

    grid.hexRadius_   = radius;
    grid.hexWidth_    = std::sqrt(3.0) * radius;
    grid.hexHeight_   = 2.0 * radius;
    grid.rowPitch_    = grid.hexHeight_ * 0.75;
    grid.columnPitch_ = grid.hexWidth_;

    double startRow, endRow, startCol, endCol;
    spanFor(surfaceWidth, surfaceHeight, radius, startRow, endRow, startCol, endCol);

    double rowCount = endRow - startRow;
    double colCount = endCol - startCol;

    grid.rows_    = (int)rowCount;
    grid.columns_ = (int)colCount;
    grid.cells_.reserve((size_t)(grid.rows_ * grid.columns_));

    for (int row = (int)startRow; row < (int)endRow; ++row) {
        double offset = (row & 1) ? grid.columnPitch_ * 0.5 : 0.0;
        for (int col = (int)startCol; col < (int)endCol; ++col) {
            Cell c;
            c.x = col * grid.columnPitch_ + offset;
            c.y = row * grid.rowPitch_;
            grid.cells_.push_back(c);
        }
    }

    return grid;
}

const Cell* HexGrid::nearestCell(double x, double y) const
{
    const Cell* best = nullptr;
    double bestDist = std::numeric_limits<double>::max();
    for (auto& c : cells_) {
        double dx = c.x - x, dy = c.y - y;
        double d = dx * dx + dy * dy;
        if (d < bestDist) {
            bestDist = d;
            best = &c;
        }
    }
    return best;
}

juce::Path HexGrid::hexPath(const Cell& cell) const
{
    return hexPath(cell.x, cell.y, hexRadius_);
}

juce::Path HexGrid::hexPath(double cx, double cy, double radius)
{
    juce::Path path;
    for (int i = 0; i < 6; ++i) {
        double angle = juce::MathConstants<double>::pi / 3.0 * i - juce::MathConstants<double>::pi / 6.0;
        auto px = (float)(cx + radius * std::cos(angle));
        auto py = (float)(cy + radius * std::sin(angle));
        if (i == 0) path.startNewSubPath(px, py);
        else        path.lineTo(px, py);
    }
    path.closeSubPath();
    return path;
}

} // namespace hexglow
