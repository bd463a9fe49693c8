#pragma once

#include "EvolutionConfig.h"
#include "Genome.h"
#include "core/training/ActionPolicy.h"

#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace SimPool {

/**
 * Scores genomes. Returns one mean fitness per genome, in input order.
 */
class PolicyEvaluator {
public:
    virtual ~PolicyEvaluator() = default;

    virtual std::vector<double> evaluate(
        const std::vector<Genome>& genomes, const std::vector<int>& layerSizes, int episodes) = 0;
};

struct Champion {
    Genome genome;
    double fitness = 0.0;
    int generation = 0;
};

struct GenerationStats {
    int generation = 0;
    double bestFitness = 0.0;
    double meanFitness = 0.0;
    double worstFitness = 0.0;
    bool newChampion = false;
};

/**
 * @brief Elitist genetic search over fixed-topology policy networks.
 *
 * Each generation is evaluated, ranked by fitness and replaced: the elite are
 * copied unchanged, the rest are children of two tournament winners (uniform
 * crossover, then bounded mutation). The all-time champion is tracked apart
 * from the current ranking and never regresses.
 */
class PopulationTrainer {
public:
    // Throws std::invalid_argument if the config does not validate.
    explicit PopulationTrainer(EvolutionConfig config, MutationConfig mutation = {});

    GenerationStats runGeneration(PolicyEvaluator& evaluator);

    /**
     * @brief Rank the current population by fitness and breed the next one.
     * fitness must have one value per genome; non-finite values rank last.
     */
    GenerationStats advance(const std::vector<double>& fitness);

    const std::vector<Genome>& population() const { return population_; }
    void setPopulation(std::vector<Genome> population);

    // Fitness of the last evaluated generation, best first.
    const std::vector<double>& rankedFitness() const { return rankedFitness_; }

    const std::optional<Champion>& champion() const { return champion_; }
    std::shared_ptr<const ActionPolicy> championPolicy() const;

    int generation() const { return generation_; }
    const EvolutionConfig& config() const { return config_; }

private:
    EvolutionConfig config_;
    MutationConfig mutation_;
    std::vector<bool> biasMask_;
    std::mt19937 rng_;

    std::vector<Genome> population_;
    std::vector<double> rankedFitness_;
    std::optional<Champion> champion_;
    int generation_ = 0;
};

} // namespace SimPool
