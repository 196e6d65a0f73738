//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// ReservoirSampler - Pick a uniform random sample of
// k items from a stream of unknown length in a single
// pass. After i items have been added every one of them
// is held in the reservoir with probability min(1, k/i).
//
#ifndef RESERVOIRSAMPLER_H
#define RESERVOIRSAMPLER_H

#include "Util.h"
#include "PoverlapErrors.h"

template<class T>
class ReservoirSampler
{
    public:
        // Throws a ConfigurationError if reservoirSize is not positive
        ReservoirSampler(int64_t reservoirSize);

        // Offer the next item of the stream to the reservoir
        void add(const T& item, RandomEngine& rng);

        void reset();

        const std::vector<T>& getSamples() const { return m_samples; }
        size_t getReservoirSize() const { return m_reservoirSize; }
        size_t getStreamSize() const { return m_streamSize; }

        // Sample k items from a generator (an object providing bool generate(T&)),
        // consuming it to the end
        template<class Generator>
        static std::vector<T> sampleStream(Generator& generator, int64_t k, RandomEngine& rng);

        // Sample k items from a vector without replacement
        static std::vector<T> sample(const std::vector<T>& items, int64_t k, RandomEngine& rng);

    private:
        std::vector<T> m_samples;
        size_t m_reservoirSize;
        size_t m_streamSize;
};

//
template<class T>
ReservoirSampler<T>::ReservoirSampler(int64_t reservoirSize) : m_reservoirSize(0), m_streamSize(0)
{
    if(reservoirSize <= 0)
    {
        std::stringstream ss;
        ss << "invalid sample size " << reservoirSize << ", must be greater than zero";
        throw ConfigurationError(ss.str());
    }
    m_reservoirSize = reservoirSize;
}

// The first k items fill the reservoir. The i-th item after that
// (1-based) replaces slot r for r drawn uniformly from [0, i-1]
// when r < k, otherwise it is discarded.
template<class T>
void ReservoirSampler<T>::add(const T& item, RandomEngine& rng)
{
    m_streamSize += 1;
    if(m_samples.size() < m_reservoirSize)
    {
        m_samples.push_back(item);
    }
    else
    {
        int64_t r = randomInRange(rng, 0, m_streamSize - 1);
        if(r < (int64_t)m_reservoirSize)
            m_samples[r] = item;
    }
}

//
template<class T>
void ReservoirSampler<T>::reset()
{
    m_samples.clear();
    m_streamSize = 0;
}

//
template<class T>
template<class Generator>
std::vector<T> ReservoirSampler<T>::sampleStream(Generator& generator, int64_t k, RandomEngine& rng)
{
    ReservoirSampler<T> sampler(k);
    T item;
    while(generator.generate(item))
        sampler.add(item, rng);
    return sampler.getSamples();
}

//
template<class T>
std::vector<T> ReservoirSampler<T>::sample(const std::vector<T>& items, int64_t k, RandomEngine& rng)
{
    ReservoirSampler<T> sampler(k);
    for(size_t i = 0; i < items.size(); ++i)
        sampler.add(items[i], rng);
    return sampler.getSamples();
}

#endif
