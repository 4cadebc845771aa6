#pragma once

#include "generatorerror.h"

#include <QtGlobal>

#include <utility>

class QRandomGenerator;

// Uniform index draws and permutations over a cryptographically secure generator.
// The default instance is backed by QRandomGenerator::system(), which is thread-safe;
// RandomSource itself holds no mutable state and can be shared freely.
class RandomSource final
{
public:
    RandomSource();
    explicit RandomSource(QRandomGenerator *generator);

    static const RandomSource &system();

    // Returns a value in [0, poolSize), or -1 (with InvalidArgument) if poolSize <= 0.
    qsizetype uniformIndex(qsizetype poolSize, GeneratorError *errorOut = nullptr) const;

    bool coinFlip() const;

    // In-place Fisher-Yates over any random-access container with size() and operator[].
    template <typename Sequence>
    void shuffle(Sequence &seq) const
    {
        for (qsizetype i = seq.size() - 1; i > 0; --i) {
            const auto j = uniformIndex(i + 1);
            if (i != j)
                std::swap(seq[i], seq[j]);
        }
    }

    template <typename Sequence>
    Sequence shuffled(Sequence seq) const
    {
        shuffle(seq);
        return seq;
    }

private:
    QRandomGenerator *generator_ = nullptr;
};
