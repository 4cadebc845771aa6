#include "randomsource.h"

#include <QRandomGenerator>

RandomSource::RandomSource() : generator_(QRandomGenerator::system()) {}

RandomSource::RandomSource(QRandomGenerator *generator)
    : generator_(generator ? generator : QRandomGenerator::system())
{
}

const RandomSource &RandomSource::system()
{
    static const RandomSource source;
    return source;
}

qsizetype RandomSource::uniformIndex(qsizetype poolSize, GeneratorError *errorOut) const
{
    if (poolSize <= 0) {
        failGeneration(errorOut, GeneratorErrorCode::InvalidArgument, QString("随机范围无效（%1）").arg(poolSize));
        return -1;
    }

    // bounded() rejects out-of-range draws internally, so there is no modulo bias.
    return static_cast<qsizetype>(generator_->bounded(static_cast<qint64>(poolSize)));
}

bool RandomSource::coinFlip() const
{
    return uniformIndex(2) == 1;
}
