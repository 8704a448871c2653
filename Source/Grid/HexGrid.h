#pragma once

#include <juce_graphics/juce_graphics.h>
#include <vector>

namespace hexglow {

// One hexagonal cell; position is the centre in surface pixels
struct Cell {
    double x = 0.0;
    double y = 0.0;
    double fillLevel = 0.0;        // rendered value, 0 - 1
    double targetFillLevel = 0.0;  // this frame's goal, 0 - 1
};

// ============================================================
// HexGrid: pointy-top honeycomb covering a surface plus margin
// ============================================================
class HexGrid {
public:
    // Upper bound on generated cells; finer radii are coarsened to fit
    static constexpr size_t MaxCells = 1u << 20;

    HexGrid() = default;

    // Rows and columns extend two rings past every edge; odd rows are
    // shifted by half a column. Non-positive or non-finite input gives
    // an empty grid; a radius too fine for MaxCells is raised until the
    // grid fits (getHexRadius() reports the radius actually used).
    static HexGrid build(double surfaceWidth, double surfaceHeight, double hexRadius);

    // Cells build() would generate at exactly this radius
    static double cellCountFor(double surfaceWidth, double surfaceHeight, double hexRadius);

    // hexRadius, or the smallest radius found above it that fits MaxCells
    static double effectiveRadius(double surfaceWidth, double surfaceHeight, double hexRadius);

    std::vector<Cell>& cells() { return cells_; }
    const std::vector<Cell>& cells() const { return cells_; }
    size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }

    double getHexRadius() const    { return hexRadius_; }
    double getHexWidth() const     { return hexWidth_; }
    double getHexHeight() const    { return hexHeight_; }
    double getRowPitch() const     { return rowPitch_; }
    double getColumnPitch() const  { return columnPitch_; }
    int getRowCount() const        { return rows_; }
    int getColumnCount() const     { return columns_; }

    // Closest cell centre to (x, y), nullptr for an empty grid
    const Cell* nearestCell(double x, double y) const;

    // Six-vertex outline of a cell at the grid's radius
    juce::Path hexPath(const Cell& cell) const;
    static juce::Path hexPath(double cx, double cy, double radius);

private:
    std::vector<Cell> cells_;
    double hexRadius_   = 0.0;
    double hexWidth_    = 0.0;
    double hexHeight_   = 0.0;
    double rowPitch_    = 0.0;
    double columnPitch_ = 0.0;
    int rows_ = 0, columns_ = 0;
};

} // namespace hexglow
