#pragma once

/**
 * @struct InputIntents
 * @brief One tick of sampled player input, independent of the device.
 *
 * thrust, rotateLeft, rotateRight and fire are level-triggered (held keys).
 * pause, restart and quit are edge-triggered: the input adapter reports them
 * on the tick the key goes down, not while it is held.
 */
struct InputIntents {
    bool thrust = false;
    bool rotateLeft = false;
    bool rotateRight = false;
    bool fire = false;
    bool pause = false;
    bool restart = false;
    bool quit = false;
};
