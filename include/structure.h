#pragma once

#include <array>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <boost/optional.hpp>

struct Atom
{
    std::string element;
    Eigen::Vector3d frac = Eigen::Vector3d::Zero();
    std::array<bool, 3> relax = {{true, true, true}}; // selective dynamics
    boost::optional<double> spin;
    bool constrained = false;
};

struct OverlapPair
{
    std::size_t first;
    std::size_t second;
    double distance;
};

// Lattice rows are the a, b, c vectors in Angstrom; atoms are grouped by element.
class Structure
{
public:
    Structure() : lattice_(Eigen::Matrix3d::Identity()) {}
    Structure(const Eigen::Matrix3d &lattice, const std::vector<Atom> &atoms);

    const Eigen::Matrix3d &lattice() const { return lattice_; }
    const std::vector<Atom> &atoms() const { return atoms_; }
    std::size_t size() const { return atoms_.size(); }

    // unique elements in order of first appearance
    std::vector<std::string> Elements() const;
    std::vector<int> ElementCounts() const;
    int RelaxedCount(const std::string &element) const;

    Eigen::Vector3d CartCoord(std::size_t index) const;
    Eigen::Vector3d FracCoord(const Eigen::Vector3d &cart) const;

    // copy with new cartesian positions, fractional coordinates re-derived from the lattice
    Structure WithCartCoords(const std::vector<Eigen::Vector3d> &carts) const;
    Structure WithAtoms(const std::vector<Atom> &atoms) const;

    double Distance(std::size_t i, std::size_t j) const;
    double MinimumImageDistance(std::size_t i, std::size_t j) const;

    std::vector<std::size_t> ConstrainedAtoms() const;

    // every pair closer than min_distance (minimum image)
    std::vector<OverlapPair> FindOverlaps(double min_distance) const;

    // same elements, counts and order; coordinates are not compared
    bool operator==(const Structure &other) const;
    bool operator!=(const Structure &other) const { return !(*this == other); }

private:
    Eigen::Matrix3d lattice_;
    std::vector<Atom> atoms_;
};

// stable regroup of atoms so that every element is contiguous
std::vector<Atom> GroupByElement(const std::vector<Atom> &atoms);
