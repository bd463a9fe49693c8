#include "PopulationTrainer.h"
#include "GenomePolicy.h"
#include "Mutation.h"
#include "Selection.h"
#include "core/LoggingChannels.h"
#include "core/training/Mlp.h"

#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace SimPool {

PopulationTrainer::PopulationTrainer(EvolutionConfig config, MutationConfig mutation)
    : config_(std::move(config)), mutation_(mutation), rng_(config_.seed)
{
    if (auto problem = validate(config_)) {
        throw std::invalid_argument("Invalid evolution config: " + *problem);
    }

    biasMask_ = Mlp::biasMask(config_.layerSizes);
    population_.reserve(config_.populationSize);
    for (int i = 0; i < config_.populationSize; i++) {
        population_.push_back(Genome::random(config_.layerSizes, rng_));
    }

    LOG_INFO(
        Evolution,
        "Population of {} genomes, {} parameters each, elite {}",
        config_.populationSize,
        biasMask_.size(),
        config_.eliteCount());
}

GenerationStats PopulationTrainer::runGeneration(PolicyEvaluator& evaluator)
{
    const auto fitness =
        evaluator.evaluate(population_, config_.layerSizes, config_.episodesPerEvaluation);
    return advance(fitness);
}

GenerationStats PopulationTrainer::advance(const std::vector<double>& fitness)
{
    if (fitness.size() != population_.size()) {
        throw std::invalid_argument(
            "Expected " + std::to_string(population_.size()) + " fitness values, got "
            + std::to_string(fitness.size()));
    }

    std::vector<double> scores = fitness;
    for (double& score : scores) {
        if (!std::isfinite(score)) {
            score = std::numeric_limits<double>::lowest();
        }
    }

    // Sort population by fitness, best first.
    const auto ranked = rankByFitness(scores);
    std::vector<Genome> sorted;
    sorted.reserve(population_.size());
    rankedFitness_.clear();
    for (size_t idx : ranked) {
        sorted.push_back(population_[idx]);
        rankedFitness_.push_back(scores[idx]);
    }

    GenerationStats stats;
    stats.generation = generation_;
    stats.bestFitness = rankedFitness_.front();
    stats.worstFitness = rankedFitness_.back();
    stats.meanFitness = std::accumulate(rankedFitness_.begin(), rankedFitness_.end(), 0.0)
        / static_cast<double>(rankedFitness_.size());

    if (!champion_.has_value() || stats.bestFitness > champion_->fitness) {
        champion_ = Champion{ sorted.front(), stats.bestFitness, generation_ };
        stats.newChampion = true;
        LOG_INFO(
            Evolution,
            "New champion in generation {}: fitness {:.3f}",
            generation_,
            stats.bestFitness);
    }

    // Keep elites unchanged, fill the rest with offspring.
    const int eliteCount = config_.eliteCount();
    const size_t candidatePool = static_cast<size_t>(eliteCount) * 2;

    std::vector<Genome> next;
    next.reserve(population_.size());
    for (int i = 0; i < eliteCount && i < static_cast<int>(sorted.size()); i++) {
        next.push_back(sorted[i]);
    }
    while (next.size() < population_.size()) {
        const Genome first =
            tournamentSelect(sorted, rankedFitness_, config_.tournamentSize, rng_, candidatePool);
        const Genome second =
            tournamentSelect(sorted, rankedFitness_, config_.tournamentSize, rng_, candidatePool);
        next.push_back(mutate(uniformCrossover(first, second, rng_), biasMask_, mutation_, rng_));
    }

    LOG_INFO(
        Evolution,
        "Generation {}: best {:.3f}, mean {:.3f}, worst {:.3f}",
        generation_,
        stats.bestFitness,
        stats.meanFitness,
        stats.worstFitness);

    population_ = std::move(next);
    generation_++;
    return stats;
}

void PopulationTrainer::setPopulation(std::vector<Genome> population)
{
    if (population.size() != population_.size()) {
        throw std::invalid_argument("Population size does not match the config");
    }
    for (const auto& genome : population) {
        if (genome.weights.size() != biasMask_.size()) {
            throw std::invalid_argument("Genome size does not match the layer sizes");
        }
    }
    population_ = std::move(population);
}

std::shared_ptr<const ActionPolicy> PopulationTrainer::championPolicy() const
{
    if (!champion_.has_value()) {
        return nullptr;
    }
    return std::make_shared<const GenomePolicy>(champion_->genome, config_.layerSizes);
}

} // namespace SimPool
