#ifndef MATROIDCORE_MATROIDS_FLATS_MATROID_HPP
#define MATROIDCORE_MATROIDS_FLATS_MATROID_HPP

#include "matroid.hpp"
#include "../sets/ground_set.hpp"
#include "../sets/ranked_family.hpp"
#include "../sets/set_system.hpp"
#include <map>

namespace matroidcore {

/**
 * Matroid encoded by its flats, indexed by rank.
 *
 * rank(X) is the rank of the first flat containing X when flats are scanned
 * by increasing rank, and closure(X) is that flat. If no flat contains X
 * (invalid data without the ground set) the matroid rank and the ground set
 * are returned instead. Construction does not check the flat axioms, see
 * is_valid().
 */
class FlatsMatroid : public Matroid {
public:
    // Pull the flats of every rank from a reference matroid
    explicit FlatsMatroid(const Matroid& reference);

    // Flats given by rank; a flat listed under two ranks keeps the lower one
    FlatsMatroid(const ElementSet& groundset,
                 const std::map<Rank, std::vector<ElementSet>>& flats,
                 const std::string& name = "");

    // Flats without ranks; ranks are taken from the inclusion order
    FlatsMatroid(const ElementSet& groundset,
                 const std::vector<ElementSet>& flats,
                 const std::string& name = "");

    Encoding encoding() const override { return Encoding::FLATS; }
    const ElementSet& groundset() const override { return groundset_->elements(); }
    const std::string& name() const override { return name_; }

    Rank full_rank() const override { return matroid_rank_; }
    Rank rank(const ElementSet& x) const override;
    ElementSet closure(const ElementSet& x) const override;
    bool is_closed(const ElementSet& x) const override;

    std::vector<ElementSet> flats(Rank k) const override;
    std::vector<size_t> whitney_numbers2() const override;

    bool is_valid(size_t num_threads = 1) const override;

    std::unique_ptr<Matroid> relabel(const ElementMap& mapping) const override;
    MatroidState export_state() const override;
    const SetSystem& defining_sets() const override { return all_; }

private:
    void index_flats();

    GroundSetPtr groundset_;
    RankedFamily F_;            // Flats by rank
    SetSystem all_;             // Flats of every rank
    Rank matroid_rank_ = 0;
    std::string name_;
};

} // namespace matroidcore

#endif // MATROIDCORE_MATROIDS_FLATS_MATROID_HPP
