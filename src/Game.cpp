#include "Game.h"
#include "PokerErrors.h"
#include <algorithm>
#include <array>
#include <random>
#include <stdexcept>

Game::Game(const GameConfig& cfg)
    : deck(cfg.seed), pot(0), stage(Stage::WAITING), config(cfg),
      dealerPosition(-1), previousDealerPosition(-1), smallBlindPosition(-1),
      bigBlindPosition(-1), currentSeed(cfg.seed), handNumber(0),
      showdownReached(false) {

    if (config.bigBlind <= 0 || config.smallBlind < 0 || config.smallBlind > config.bigBlind) {
        throw std::invalid_argument("Blinds must satisfy 0 <= smallBlind <= bigBlind and bigBlind > 0");
    }
    if (config.startingChips <= 0) {
        throw std::invalid_argument("startingChips must be positive");
    }
    if (config.minPlayers < 2 || config.maxPlayers < config.minPlayers || config.maxPlayers > kMaxSeats) {
        throw std::invalid_argument("Player limits must satisfy 2 <= minPlayers <= maxPlayers <= " +
                                    std::to_string(kMaxSeats));
    }

    std::array<bool, Card::kDeckSize> seen{};
    for (const auto& text : config.exactCards) {
        Card card(text);
        if (seen[card.index()]) {
            throw std::invalid_argument("Duplicate card in exactCards: " + text);
        }
        seen[card.index()] = true;
        stackedCards.push_back(card);
    }

    if (currentSeed == 0) {
        currentSeed = std::random_device{}();
    }
}

void Game::recordEvent(GameEvent event) {
    event.handNumber = handNumber;
    history.push_back(std::move(event));
}

bool Game::addPlayer(std::string_view id, std::string_view name, int chips) {
    if (isHandInProgress()) {
        return false;
    }

    if (players.size() >= static_cast<size_t>(std::min(config.maxPlayers, kMaxSeats))) {
        return false;
    }

    if (id.empty() || playerLookup.contains(id)) {
        return false;
    }

    const int startingChips = (chips > 0) ? chips : config.startingChips;

    auto player = std::make_unique<Player>(id, name, startingChips);
    player->setSeat(static_cast<int>(players.size()));
    playerLookup[player->getId()] = player.get();
    players.push_back(std::move(player));

    return true;
}

bool Game::removePlayer(std::string_view id) {
    if (isHandInProgress()) {
        return false;
    }

    auto it = std::find_if(players.begin(), players.end(),
        [id](const auto& p) { return p->getId() == id; });

    if (it == players.end()) {
        return false;
    }

    const int removedSeat = (*it)->getSeat();
    players.erase(it);

    // Keep the button so that the seat after the removed one is next
    if (removedSeat <= dealerPosition) {
        dealerPosition--;
    }

    playerLookup.clear();
    for (size_t i = 0; i < players.size(); i++) {
        players[i]->setSeat(static_cast<int>(i));
        playerLookup[players[i]->getId()] = players[i].get();
    }

    return true;
}

bool Game::sitOut(std::string_view id) {
    Player* player = getPlayer(id);
    if (!player) {
        return false;
    }
    player->sitOut();
    return true;
}

bool Game::sitIn(std::string_view id) {
    Player* player = getPlayer(id);
    if (!player) {
        return false;
    }
    player->sitIn();
    return true;
}

Player* Game::getPlayer(std::string_view id) {
    auto it = playerLookup.find(id);
    return (it != playerLookup.end()) ? it->second : nullptr;
}

const Player* Game::getPlayer(std::string_view id) const {
    auto it = playerLookup.find(id);
    return (it != playerLookup.end()) ? it->second : nullptr;
}

std::vector<Player*> Game::getPlayers() {
    std::vector<Player*> result;
    result.reserve(players.size());
    for (auto& player : players) {
        result.push_back(player.get());
    }
    return result;
}

std::vector<const Player*> Game::getPlayers() const {
    std::vector<const Player*> result;
    result.reserve(players.size());
    for (const auto& player : players) {
        result.push_back(player.get());
    }
    return result;
}

int Game::countPlayersWithChips() const {
    return static_cast<int>(std::count_if(players.begin(), players.end(), [](const auto& p) {
        return p->getChips() > 0 && !p->isSittingOutRequested();
    }));
}

bool Game::isHandInProgress() const noexcept {
    return stage != Stage::WAITING && stage != Stage::HAND_COMPLETE;
}

int Game::nextSeatInHand(int fromSeat) const {
    const int n = static_cast<int>(players.size());
    for (int step = 1; step <= n; step++) {
        const int seat = ((fromSeat + step) % n + n) % n;
        if (players[seat]->getState() != Player::State::SITTING_OUT) {
            return seat;
        }
    }
    return -1;
}

std::vector<int> Game::liveSeats() const {
    std::vector<int> seats;
    for (const auto& player : players) {
        if (player->isInHand()) {
            seats.push_back(player->getSeat());
        }
    }
    return seats;
}

bool Game::startHand() {
    if (isHandInProgress()) {
        return false;
    }

    if (countPlayersWithChips() < config.minPlayers) {
        return false;
    }

    guarded(&Game::setupHand);
    return true;
}

void Game::guarded(void (Game::*step)()) {
    try {
        (this->*step)();
    } catch (const EmptyDeckError& e) {
        abortHand(e.what());
        throw;
    } catch (const PotConservationError& e) {
        abortHand(e.what());
        throw;
    }
}

void Game::setupHand() {
    handNumber++;
    history.clear();
    communityCards.clear();
    lastResult.reset();
    showdownReached = false;
    stage = Stage::HAND_SETUP;

    pot.reset(static_cast<int>(players.size()));
    deck.reseed(currentSeed + static_cast<unsigned int>(handNumber));
    deck.reset();
    if (!stackedCards.empty()) {
        deck.stack(stackedCards);
    }

    for (auto& player : players) {
        player->resetForNewHand();
    }

    previousDealerPosition = dealerPosition;
    dealerPosition = nextSeatInHand(dealerPosition);

    const auto dealtIn = std::count_if(players.begin(), players.end(), [](const auto& p) {
        return p->getState() == Player::State::ACTIVE;
    });

    // Heads-up the button posts the small blind
    if (dealtIn == 2) {
        smallBlindPosition = dealerPosition;
    } else {
        smallBlindPosition = nextSeatInHand(dealerPosition);
    }
    bigBlindPosition = nextSeatInHand(smallBlindPosition);

    players[dealerPosition]->setDealer(true);
    players[smallBlindPosition]->setSmallBlind(true);
    players[bigBlindPosition]->setBigBlind(true);

    GameEvent started;
    started.type = GameEvent::Type::HAND_STARTED;
    started.playerId = players[dealerPosition]->getId();
    started.amount = static_cast<int>(dealtIn);
    recordEvent(std::move(started));

    auto postBlind = [this](int seat, int amount, const char* label) {
        const int posted = players[seat]->postBlind(amount);
        pot.contribute(seat, posted);

        GameEvent event;
        event.type = GameEvent::Type::BLIND_POSTED;
        event.playerId = players[seat]->getId();
        event.amount = posted;
        event.total = players[seat]->getBet();
        event.detail = label;
        recordEvent(std::move(event));
    };
    postBlind(smallBlindPosition, config.smallBlind, "small");
    postBlind(bigBlindPosition, config.bigBlind, "big");

    // Two cards each, starting left of the button
    int seat = dealerPosition;
    for (long i = 0; i < dealtIn; i++) {
        seat = nextSeatInHand(seat);
        Player* player = players[seat].get();
        player->dealHoleCards(deck.dealCards(2));

        GameEvent event;
        event.type = GameEvent::Type::HOLE_CARDS_DEALT;
        event.playerId = player->getId();
        event.cards = player->getHoleCards();
        recordEvent(std::move(event));
    }

    const int firstToAct = (dealtIn == 2) ? smallBlindPosition : nextSeatInHand(bigBlindPosition);
    beginStreet(BettingRound::Street::PREFLOP, Stage::PREFLOP_BETTING, firstToAct);
    advance();
}

void Game::beginStreet(BettingRound::Street street, Stage bettingStage, int firstSeat) {
    if (street != BettingRound::Street::PREFLOP) {
        for (auto& player : players) {
            player->resetBet();
            if (player->canAct()) {
                player->setLastAction(Player::Action::NONE);
            }
        }
        pot.startNewStreet();
    }

    round.emplace(street, getPlayers(), pot, config.bigBlind, firstSeat);
    stage = bettingStage;
}

void Game::dealBoard(size_t count, const char* streetLabel) {
    std::vector<Card> cards = deck.dealCards(count);
    communityCards.insert(communityCards.end(), cards.begin(), cards.end());

    GameEvent event;
    event.type = GameEvent::Type::BOARD_DEALT;
    event.cards = std::move(cards);
    event.detail = streetLabel;
    recordEvent(std::move(event));
}

void Game::advance() {
    while (round && round->isComplete()) {
        const auto live = liveSeats();
        if (live.size() <= 1) {
            awardUncontested(live.front());
            return;
        }

        const int firstSeat = dealerPosition + 1;
        switch (stage) {
            case Stage::PREFLOP_BETTING:
                stage = Stage::FLOP;
                dealBoard(3, "Flop");
                beginStreet(BettingRound::Street::FLOP, Stage::FLOP_BETTING, firstSeat);
                break;

            case Stage::FLOP_BETTING:
                stage = Stage::TURN;
                dealBoard(1, "Turn");
                beginStreet(BettingRound::Street::TURN, Stage::TURN_BETTING, firstSeat);
                break;

            case Stage::TURN_BETTING:
                stage = Stage::RIVER;
                dealBoard(1, "River");
                beginStreet(BettingRound::Street::RIVER, Stage::RIVER_BETTING, firstSeat);
                break;

            case Stage::RIVER_BETTING:
                showdown();
                return;

            default:
                return;
        }
    }
}

void Game::processAction(std::string_view playerId, Player::Action action, int amount) {
    if (!round || round->isComplete()) {
        throw IllegalActionError::noHandInProgress();
    }

    Player* player = getPlayer(playerId);
    if (!player) {
        throw IllegalActionError::unknownPlayer(std::string(playerId));
    }

    const auto record = round->act(player->getSeat(), action, amount);

    GameEvent event;
    event.type = GameEvent::Type::PLAYER_ACTION;
    event.playerId = player->getId();
    event.action = record.action;
    event.amount = record.chipsCommitted;
    event.total = record.streetTotal;
    event.detail = BettingRound::streetName(round->getStreet());
    recordEvent(std::move(event));

    guarded(&Game::advance);
}

std::string Game::forfeitCurrentAction() {
    const Player* current = getCurrentPlayer();
    if (!current) {
        throw IllegalActionError::noHandInProgress();
    }
    std::string id = current->getId();
    processAction(id, Player::Action::FOLD);
    return id;
}

void Game::showdown() {
    stage = Stage::SHOWDOWN;
    showdownReached = true;

    const auto live = liveSeats();
    std::map<int, Hand::EvaluatedHand> ranks;
    std::vector<PlayerHandResult> hands;

    for (int seat : live) {
        const Player* player = players[seat].get();
        Hand::EvaluatedHand evaluated = player->evaluateHand(communityCards);

        PlayerHandResult hand;
        hand.playerId = player->getId();
        hand.handRanking = evaluated.getRankingName();
        hand.description = evaluated.describe();
        hand.bestFive = evaluated.bestFive;
        hands.push_back(hand);

        GameEvent event;
        event.type = GameEvent::Type::SHOWDOWN;
        event.playerId = player->getId();
        event.cards = player->getHoleCards();
        event.detail = hand.description;
        recordEvent(std::move(event));

        ranks.emplace(seat, std::move(evaluated));
    }

    const auto awards = pot.resolve(live, ranks, dealerPosition, config.oddChipPolicy);
    finishHand(awards, true, std::move(hands));
}

void Game::awardUncontested(int seat) {
    finishHand(pot.awardUncontested(seat), false, {});
}

void Game::finishHand(const std::vector<Pot::TierAward>& awards, bool wentToShowdown,
                      std::vector<PlayerHandResult> hands) {
    HandResult result;
    result.handNumber = handNumber;
    result.showdown = wentToShowdown;
    result.board = communityCards;
    result.hands = std::move(hands);

    for (size_t i = 0; i < awards.size(); i++) {
        const auto& award = awards[i];
        TierResult tier;
        tier.amount = award.tier.amount;
        for (int seat : award.tier.eligibleSeats) {
            tier.eligiblePlayerIds.push_back(players[seat]->getId());
        }
        for (int seat : award.winnerSeats) {
            tier.winnerIds.push_back(players[seat]->getId());
        }

        for (const auto& [seat, chips] : award.awards) {
            Player* winner = players[seat].get();
            winner->winChips(chips);
            tier.awards[winner->getId()] += chips;
            result.payouts[winner->getId()] += chips;

            GameEvent event;
            event.type = GameEvent::Type::POT_AWARDED;
            event.playerId = winner->getId();
            event.amount = chips;
            event.detail = (i == 0) ? "Main pot" : "Side pot " + std::to_string(i);
            recordEvent(std::move(event));
        }

        result.tiers.push_back(std::move(tier));
    }

    for (const auto& player : players) {
        result.finalStacks[player->getId()] = player->getChips();
    }

    round.reset();
    pot.reset(static_cast<int>(players.size()));
    stage = Stage::HAND_COMPLETE;
    lastResult = std::move(result);
}

bool Game::abortHand(const std::string& reason) {
    if (!isHandInProgress()) {
        return false;
    }

    for (auto& player : players) {
        player->restoreHandStart();
    }

    round.reset();
    communityCards.clear();
    pot.reset(static_cast<int>(players.size()));
    dealerPosition = previousDealerPosition;
    showdownReached = false;

    GameEvent event;
    event.type = GameEvent::Type::HAND_ABORTED;
    event.detail = reason;
    recordEvent(std::move(event));

    HandResult result;
    result.handNumber = handNumber;
    result.aborted = true;
    result.abortReason = reason;
    for (const auto& player : players) {
        result.finalStacks[player->getId()] = player->getChips();
    }
    lastResult = std::move(result);

    stage = Stage::WAITING;
    return true;
}

Player* Game::getCurrentPlayer() {
    if (round && !round->isComplete()) {
        return players[round->getCurrentSeat()].get();
    }
    return nullptr;
}

const Player* Game::getCurrentPlayer() const {
    if (round && !round->isComplete()) {
        return players[round->getCurrentSeat()].get();
    }
    return nullptr;
}

BettingRound::ActionConstraints Game::getActionConstraints() const {
    if (!round) {
        return BettingRound::ActionConstraints();
    }
    return round->getConstraints();
}

bool Game::canSeeHoleCards(const Player& player, std::string_view viewerId) const {
    if (!viewerId.empty() && player.getId() == viewerId) {
        return true;
    }
    return showdownReached && player.isInHand();
}

TableSnapshot Game::snapshot(std::string_view viewerId) const {
    TableSnapshot view;
    view.stage = getStageName();
    view.street = round ? BettingRound::streetName(round->getStreet()) : "";
    view.handNumber = handNumber;
    view.board = communityCards;
    view.totalPot = pot.getTotalPot();
    view.currentBet = getCurrentBet();
    view.minRaise = getMinRaise();
    view.dealerSeat = dealerPosition;

    if (const Player* current = getCurrentPlayer()) {
        view.currentPlayerId = current->getId();
    }

    if (isHandInProgress()) {
        for (const auto& tier : pot.computeTiers(liveSeats())) {
            PotView potView;
            potView.amount = tier.amount;
            for (int seat : tier.eligibleSeats) {
                potView.eligiblePlayerIds.push_back(players[seat]->getId());
            }
            view.pots.push_back(std::move(potView));
        }
    }

    for (const auto& player : players) {
        PlayerView pv;
        pv.id = player->getId();
        pv.name = player->getName();
        pv.seat = player->getSeat();
        pv.chips = player->getChips();
        pv.bet = player->getBet();
        pv.totalBet = player->getTotalBet();
        pv.state = player->getState();
        pv.lastAction = player->getLastAction();
        pv.isDealer = player->getIsDealer();
        pv.isSmallBlind = player->getIsSmallBlind();
        pv.isBigBlind = player->getIsBigBlind();
        pv.holeCardsVisible = canSeeHoleCards(*player, viewerId);
        if (pv.holeCardsVisible) {
            pv.holeCards = player->getHoleCards();
        }
        view.players.push_back(std::move(pv));
    }

    view.history.reserve(history.size());
    for (const auto& event : history) {
        GameEvent visible = event;
        if (event.type == GameEvent::Type::HOLE_CARDS_DEALT) {
            const Player* owner = getPlayer(event.playerId);
            if (!owner || !canSeeHoleCards(*owner, viewerId)) {
                visible.cards.clear();
            }
        }
        view.history.push_back(std::move(visible));
    }

    return view;
}

std::string Game::getStageName() const {
    return stageName(stage);
}

std::string Game::stageName(Stage s) {
    static constexpr const char* const stageNames[] = {
        "Waiting", "HandSetup", "PreflopBetting", "Flop", "FlopBetting", "Turn",
        "TurnBetting", "River", "RiverBetting", "Showdown", "HandComplete"
    };
    static constexpr size_t nameCount = sizeof(stageNames) / sizeof(stageNames[0]);

    const auto idx = static_cast<size_t>(s);
    if (idx < nameCount) {
        return stageNames[idx];
    }
    return "Unknown";
}
