#include "bytes.hpp"
#include "commitment_scheme.hpp"
#include "fixed_point.hpp"
#include "secure_random.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

// Participant-side helper: prints the salt to keep and the hash to submit.
int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: make_commitment <prediction> <participantHex> [saltHex]\n";
        return 1;
    }

    try {
        wh::Fixed64 prediction = wh::Fixed64::parse(argv[1]);
        wh::Identity participant = wh::bytes32FromHex(argv[2]);
        wh::Salt salt = (argc > 3) ? wh::bytes32FromHex(argv[3]) : wh::generateSalt();

        wh::CommitmentHash hash = wh::computeCommitment(prediction.raw(), salt, participant);
        std::cout << "prediction_raw: " << prediction.raw() << '\n';
        std::cout << "salt:           " << wh::toHex(salt) << '\n';
        std::cout << "commitment:     " << wh::toHex(hash) << '\n';
        std::cout << "Keep the salt private until the reveal window; without it the stake is forfeit.\n";
    } catch (const std::exception& ex) {
        std::cerr << "make_commitment: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
