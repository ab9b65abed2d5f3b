#include "structure.h"

#include <algorithm>
#include <cmath>
#include <limits>

////////////////////////// Structure //////////////////////////

Structure::Structure(const Eigen::Matrix3d &lattice, const std::vector<Atom> &atoms)
    : lattice_(lattice), atoms_(atoms)
{
}

std::vector<std::string> Structure::Elements() const
{
    std::vector<std::string> elements;
    for (const auto &atom : atoms_)
    {
        if (std::find(elements.begin(), elements.end(), atom.element) == elements.end())
        {
            elements.push_back(atom.element);
        }
    }
    return elements;
}

std::vector<int> Structure::ElementCounts() const
{
    std::vector<std::string> elements = Elements();
    std::vector<int> counts(elements.size(), 0);
    for (const auto &atom : atoms_)
    {
        counts[std::find(elements.begin(), elements.end(), atom.element) - elements.begin()]++;
    }
    return counts;
}

int Structure::RelaxedCount(const std::string &element) const
{
    return static_cast<int>(std::count_if(atoms_.begin(), atoms_.end(), [&element](const Atom &atom)
                                          { return atom.element == element && atom.relax[0] && atom.relax[1] && atom.relax[2]; }));
}

Eigen::Vector3d Structure::CartCoord(std::size_t index) const
{
    return lattice_.transpose() * atoms_.at(index).frac;
}

Eigen::Vector3d Structure::FracCoord(const Eigen::Vector3d &cart) const
{
    return lattice_.transpose().inverse() * cart;
}

Structure Structure::WithCartCoords(const std::vector<Eigen::Vector3d> &carts) const
{
    std::vector<Atom> atoms = atoms_;
    for (std::size_t i = 0; i < atoms.size(); ++i)
    {
        atoms[i].frac = FracCoord(carts.at(i));
    }
    return Structure(lattice_, atoms);
}

Structure Structure::WithAtoms(const std::vector<Atom> &atoms) const
{
    return Structure(lattice_, atoms);
}

double Structure::Distance(std::size_t i, std::size_t j) const
{
    return (lattice_.transpose() * (atoms_.at(i).frac - atoms_.at(j).frac)).norm();
}

double Structure::MinimumImageDistance(std::size_t i, std::size_t j) const
{
    Eigen::Vector3d diff = atoms_.at(i).frac - atoms_.at(j).frac;
    for (int k = 0; k < 3; ++k)
    {
        diff[k] -= std::round(diff[k]);
    }

    // neighbouring cells cover skewed lattices
    double best = std::numeric_limits<double>::max();
    for (int a = -1; a <= 1; ++a)
    {
        for (int b = -1; b <= 1; ++b)
        {
            for (int c = -1; c <= 1; ++c)
            {
                Eigen::Vector3d shifted = diff + Eigen::Vector3d(a, b, c);
                best = std::min(best, (lattice_.transpose() * shifted).norm());
            }
        }
    }
    return best;
}

std::vector<std::size_t> Structure::ConstrainedAtoms() const
{
    std::vector<std::size_t> indices;
    for (std::size_t i = 0; i < atoms_.size(); ++i)
    {
        if (atoms_[i].constrained)
        {
            indices.push_back(i);
        }
    }
    return indices;
}

std::vector<OverlapPair> Structure::FindOverlaps(double min_distance) const
{
    std::vector<OverlapPair> overlaps;
    for (std::size_t i = 0; i < atoms_.size(); ++i)
    {
        for (std::size_t j = i + 1; j < atoms_.size(); ++j)
        {
            double distance = MinimumImageDistance(i, j);
            if (distance < min_distance)
            {
                overlaps.push_back({i, j, distance});
            }
        }
    }
    return overlaps;
}

bool Structure::operator==(const Structure &other) const
{
    if (atoms_.size() != other.atoms_.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < atoms_.size(); ++i)
    {
        if (atoms_[i].element != other.atoms_[i].element)
        {
            return false;
        }
    }
    return true;
}

std::vector<Atom> GroupByElement(const std::vector<Atom> &atoms)
{
    std::vector<std::string> elements = Structure(Eigen::Matrix3d::Identity(), atoms).Elements();
    std::vector<Atom> grouped;
    grouped.reserve(atoms.size());
    for (const auto &element : elements)
    {
        for (const auto &atom : atoms)
        {
            if (atom.element == element)
            {
                grouped.push_back(atom);
            }
        }
    }
    return grouped;
}
