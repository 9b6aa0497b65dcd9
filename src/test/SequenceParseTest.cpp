#include <cassert>
#include <iostream>

#include "application/MergeCoordinator.hpp"
#include "domain/Fragment.hpp"

using namespace streamscribe::domain;
using streamscribe::application::MergeCoordinator;

int main() {
    std::cout << "[Test] Starting Sequence Parse Test..." << std::endl;

    // Trailing digit run of the stem
    assert(ParseSequenceNumber("chunk_001.wav") == 1);
    assert(ParseSequenceNumber("rec_2025_045.wav") == 45);
    assert(ParseSequenceNumber("001.wav") == 1);
    assert(ParseSequenceNumber("part12.mp3") == 12);
    assert(ParseSequenceNumber("/tmp/input/chunk_007.wav") == 7);

    // First digit run when the stem does not end in digits
    assert(ParseSequenceNumber("take3_final.wav") == 3);

    // Nothing to parse
    assert(!ParseSequenceNumber("no_digits.wav").has_value());
    assert(!ParseSequenceNumber("").has_value());
    assert(!ParseSequenceNumber("99999999999999999999999.wav").has_value());
    std::cout << "[PASS] File names parsed." << std::endl;

    assert(FormatSequence(0) == "000");
    assert(FormatSequence(7) == "007");
    assert(FormatSequence(1234) == "1234");
    assert(MergeCoordinator::ArchiveFileName(0, 4) == "full_000_to_004.txt");
    assert(MergeCoordinator::ArchiveFileName(12, 12) == "full_012_to_012.txt");
    std::cout << "[PASS] Sequence formatting." << std::endl;

    Fragment f;
    assert(f.sequence == -1);
    assert(f.status == FragmentStatus::Pending);
    assert(std::string(Fragment::StatusToString(FragmentStatus::Failed)) == "failed");

    std::cout << "[Test] Sequence Parse Test completed." << std::endl;
    return 0;
}
