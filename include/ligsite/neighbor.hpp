// Copyright The ligsite Authors.
//
// Cell-linked lists method for atom searching (a.k.a. grid search, binning,
// bucketing, cell technique for neighbor search, etc).
// Cells are kept in a hash map, so only occupied cells use memory
// and atoms can have any coordinates.

#ifndef LIGSITE_NEIGHBOR_HPP_
#define LIGSITE_NEIGHBOR_HPP_

#include <cmath>          // for floor, fabs
#include <cstddef>        // for size_t
#include <unordered_map>
#include <vector>

#include "fail.hpp"       // for fail
#include "math.hpp"       // for Position, sq
#include "model.hpp"      // for Atom

namespace ligsite {

struct CellIndex {
  int u, v, w;
  bool operator==(const CellIndex& o) const { return u == o.u && v == o.v && w == o.w; }
};

struct CellIndexHash {
  size_t operator()(const CellIndex& c) const {
    // large primes, as in the classic spatial hashing scheme
    return (size_t(c.u) * 73856093) ^ (size_t(c.v) * 19349663) ^
           (size_t(c.w) * 83492791);
  }
};

struct NeighborSearch {
  // squared distance below which two positions are considered the same point
  static constexpr double same_point_dist_sq = 1e-4;

  struct Mark {
    Position pos;
    int serial;
    int atom_idx;  // index in the atom list used to populate the grid

    Mark(const Position& p, int serial_, int idx)
      : pos(p), serial(serial_), atom_idx(idx) {}

    const Atom& to_atom(const std::vector<Atom>& atoms) const {
      return atoms.at(atom_idx);
    }
  };

  std::unordered_map<CellIndex, std::vector<Mark>, CellIndexHash> cells;
  double cell_size = 5.0;
  const std::vector<Atom>* atoms = nullptr;
  size_t mark_count = 0;

  NeighborSearch() = default;
  // The atom list must outlive the NeighborSearch.
  NeighborSearch(const std::vector<Atom>& atoms_, double cell_size_)
    : cell_size(cell_size_), atoms(&atoms_) {
    if (!(cell_size > 0))
      fail("NeighborSearch: cell size must be positive, not ",
           std::to_string(cell_size));
  }

  /// Adds all atoms.
  NeighborSearch& populate() {
    return populate([](const Atom&) { return true; });
  }
  /// Adds atoms for which pred(atom) is true.
  template<typename Pred>
  NeighborSearch& populate(const Pred& pred) {
    if (!atoms)
      fail("NeighborSearch not initialized");
    for (int n = 0; n != (int) atoms->size(); ++n) {
      const Atom& atom = (*atoms)[n];
      if (pred(atom))
        add_atom(atom, n);
    }
    return *this;
  }

  void add_atom(const Atom& atom, int n) {
    cells[cell_index(atom.pos)].emplace_back(atom.pos, atom.serial, n);
    ++mark_count;
  }

  CellIndex cell_index(const Position& pos) const {
    return {cell_coord(pos.x), cell_coord(pos.y), cell_coord(pos.z)};
  }

  size_t size() const { return mark_count; }

  /// Calls func(marks) for each occupied cell that intersects the cube
  /// of half-width radius around pos.
  template<typename Func>
  void for_each_cell(const Position& pos, double radius, const Func& func) const {
    int u0 = cell_coord(pos.x - radius), u1 = cell_coord(pos.x + radius);
    int v0 = cell_coord(pos.y - radius), v1 = cell_coord(pos.y + radius);
    int w0 = cell_coord(pos.z - radius), w1 = cell_coord(pos.z + radius);
    // if the cube spans more cells than are occupied, go through the map
    double n = (double(u1) - u0 + 1) * (double(v1) - v0 + 1) * (double(w1) - w0 + 1);
    if (n > (double) cells.size()) {
      for (const auto& item : cells) {
        const CellIndex& c = item.first;
        if (c.u >= u0 && c.u <= u1 && c.v >= v0 && c.v <= v1 &&
            c.w >= w0 && c.w <= w1)
          func(item.second);
      }
      return;
    }
    for (int u = u0; u <= u1; ++u)
      for (int v = v0; v <= v1; ++v)
        for (int w = w0; w <= w1; ++w) {
          auto it = cells.find(CellIndex{u, v, w});
          if (it != cells.end())
            func(it->second);
        }
  }

  /// Calls func(mark, dist_sq) for marks within radius (inclusive)
  /// excluding marks at the position pos itself.
  template<typename Func>
  void for_each(const Position& pos, double radius, const Func& func) const {
    if (radius <= 0)
      return;
    double radius_sq = sq(radius);
    for_each_cell(pos, radius, [&](const std::vector<Mark>& marks) {
        for (const Mark& m : marks) {
          double dist_sq = m.pos.dist_sq(pos);
          if (dist_sq <= radius_sq && dist_sq > same_point_dist_sq)
            func(m, dist_sq);
        }
    });
  }

  std::vector<const Mark*> find_atoms(const Position& pos, double radius) const {
    std::vector<const Mark*> out;
    for_each(pos, radius, [&](const Mark& m, double) { out.push_back(&m); });
    return out;
  }

  /// Atoms within radius from the atom, which itself (the same serial
  /// number) is never returned, even if atom is not from this grid.
  std::vector<const Atom*> find_neighbors(const Atom& atom, double radius) const {
    std::vector<const Atom*> out;
    for_each(atom.pos, radius, [&](const Mark& m, double) {
        if (m.serial != atom.serial)
          out.push_back(&m.to_atom(*atoms));
    });
    return out;
  }

private:
  // |floor(x / cell_size)| above this is rejected, so it fits in int
  static constexpr double max_cell_coord = 1e9;

  int cell_coord(double x) const {
    double c = std::floor(x / cell_size);
    if (!(std::fabs(c) <= max_cell_coord))
      fail("NeighborSearch: coordinate ", std::to_string(x),
           " is out of range for cell size ", std::to_string(cell_size));
    return (int) c;
  }
};

} // namespace ligsite
#endif
