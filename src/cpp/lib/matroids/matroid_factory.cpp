#include "matroid_factory.hpp"
#include "circuits_matroid.hpp"
#include "flats_matroid.hpp"
#include "lattice_of_flats_matroid.hpp"

namespace matroidcore {

std::unique_ptr<Matroid> make_matroid(const MatroidState& state) {
    switch (state.encoding) {
        case Encoding::CIRCUITS:
            return std::make_unique<CircuitsMatroid>(state.groundset, state.sets, state.name);
        case Encoding::FLATS:
            return std::make_unique<FlatsMatroid>(state.groundset, state.ranked_sets, state.name);
        case Encoding::LATTICE_OF_FLATS:
            return std::make_unique<LatticeOfFlatsMatroid>(state.groundset, state.sets, state.name);
    }
    throw InvalidInputError("Unknown encoding in matroid state");
}

std::unique_ptr<Matroid> convert(const Matroid& reference, Encoding encoding) {
    switch (encoding) {
        case Encoding::CIRCUITS:
            return std::make_unique<CircuitsMatroid>(reference);
        case Encoding::FLATS:
            return std::make_unique<FlatsMatroid>(reference);
        case Encoding::LATTICE_OF_FLATS:
            return std::make_unique<LatticeOfFlatsMatroid>(reference);
    }
    throw InvalidInputError("Unknown encoding: " + encoding_name(encoding));
}

} // namespace matroidcore
